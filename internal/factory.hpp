#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/model/profile.hpp"

namespace renter::engine { class RenterEngine; }
namespace renter::service { class ControlService; }

namespace renter::factory {

/*
  Application

  Long-lived objects built from the runtime config. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  renter::model::Profile                           profile = renter::model::Profile::kStandard;
  std::shared_ptr<renter::engine::RenterEngine>    engine;
  std::shared_ptr<renter::service::ControlService> control;
};

/*
  Composition root. The only place that knows concrete engine types.
  Throws std::invalid_argument on a bad profile or engine section.
*/
Application Build(const renter::runtime::config::RuntimeConfig& config);

} // namespace renter::factory
