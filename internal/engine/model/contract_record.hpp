#pragma once

#include <string>
#include <vector>

#include "internal/model/currency.hpp"
#include "internal/model/profile.hpp"

namespace renter::engine::model {

/*
  A file contract as the engine tracks it.

  The stored size is not recorded; it is derived from the number of Merkle
  roots when the contract is projected for callers.
*/

struct ContractRecord {
  std::string id;  // hex contract id

  renter::model::BlockHeight end_height = 0;

  std::string net_address;

  renter::model::Currency renter_funds;

  // One root per sector stored with the host, in upload order.
  std::vector<std::string> merkle_roots;
};

} // namespace renter::engine::model
