#pragma once

#include <cstdint>
#include <string>

#include "internal/model/currency.hpp"
#include "internal/model/profile.hpp"

namespace renter::engine::model {

struct HostRecord {
  std::string net_address;
  std::string public_key;

  bool accepting_contracts = false;

  renter::model::BlockHeight max_duration = 0;

  renter::model::Currency contract_price;
  renter::model::Currency storage_price;
  renter::model::Currency upload_bandwidth_price;
  renter::model::Currency download_bandwidth_price;

  std::uint64_t total_storage     = 0;
  std::uint64_t remaining_storage = 0;

  std::string version;
};

} // namespace renter::engine::model
