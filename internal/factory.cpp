#include "factory.hpp"

#include <stdexcept>

#include "internal/engine/memory/memory_renter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/control_service.hpp"
#include "internal/service/service_context.hpp"

namespace renter::factory {

namespace {

std::shared_ptr<engine::RenterEngine> BuildEngine(const renter::runtime::config::RuntimeConfig& config,
                                                  renter::model::Profile profile) {
  const auto& engine_config = config.engine();

  switch (engine_config.backend_case()) {
    case renter::runtime::config::EngineConfig::kMemory:
      return std::make_shared<engine::memory::MemoryRenter>(engine_config.memory(), profile);
    case renter::runtime::config::EngineConfig::BACKEND_NOT_SET:
      break;
  }

  // No engine section: an empty in-memory engine.
  return std::make_shared<engine::memory::MemoryRenter>(renter::runtime::config::MemoryEngineConfig{}, profile);
}

} // namespace

Application Build(const renter::runtime::config::RuntimeConfig& config) {
  Application app;

  app.profile = renter::model::ParseProfile(config.profile());
  app.engine  = BuildEngine(config, app.profile);

  service::ServiceContext ctx;
  ctx.engine  = app.engine;
  ctx.profile = app.profile;

  app.control = std::make_shared<service::ControlService>(ctx);

  RENTER_LOG_INFO("application built", {renter::observability::StringField("profile", renter::model::ToString(app.profile))});
  return app;
}

} // namespace renter::factory
