#include "internal/factory.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/service/control_service.hpp"

namespace {

void TestBuildsMemoryEngineForProfile() {
  auto config = renter::config::ConfigLoader::LoadFromString(R"(profile: dev
engine:
  memory:
    block_height: 5
    hosts:
      - net_address: "host-a:9982"
        accepting_contracts: true
      - net_address: "host-b:9982"
        accepting_contracts: false
)");

  auto app = renter::factory::Build(config);
  assert(app.profile == renter::model::Profile::kDev);
  assert(app.engine != nullptr);
  assert(app.control != nullptr);

  assert(app.control->ListAllHosts(renter::control::v1::ListAllHostsRequest{}).hosts_size() == 2);
  assert(app.control->ListActiveHosts(renter::control::v1::ListActiveHostsRequest{}).hosts_size() == 1);

  renter::control::v1::SetSettingsRequest req;
  req.set_funds("100");
  req.set_period("10");
  // Dev recommends four hosts.
  assert(app.control->SetSettings(req).settings().allowance().hosts() == 4);
}

void TestEmptyConfigUsesStandardProfile() {
  renter::runtime::config::RuntimeConfig config;
  auto app = renter::factory::Build(config);
  assert(app.profile == renter::model::Profile::kStandard);
  assert(app.control->ListAllHosts(renter::control::v1::ListAllHostsRequest{}).hosts_size() == 0);
}

void TestUnknownProfileFails() {
  renter::runtime::config::RuntimeConfig config;
  config.set_profile("mainnet");

  bool threw = false;
  try {
    (void)renter::factory::Build(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestBadHostPriceFails() {
  renter::runtime::config::RuntimeConfig config;
  auto* host = config.mutable_engine()->mutable_memory()->add_hosts();
  host->set_net_address("host-a:9982");
  host->set_contract_price("free");

  bool threw = false;
  try {
    (void)renter::factory::Build(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuildsMemoryEngineForProfile();
  TestEmptyConfigUsesStandardProfile();
  TestUnknownProfileFails();
  TestBadHostPriceFails();

  std::cout << "renter_control_unit_factory: pass\n";
  return 0;
}
