#pragma once

#include <cstdint>

#include "internal/model/currency.hpp"
#include "internal/model/profile.hpp"

namespace renter::model {

struct Allowance {
  Currency      funds;
  std::uint64_t hosts        = 0;
  BlockHeight   period       = 0;
  BlockHeight   renew_window = 0;

  bool operator==(const Allowance&) const = default;
};

struct RenterSettings {
  Allowance allowance;

  bool operator==(const RenterSettings&) const = default;
};

struct FinancialMetrics {
  Currency contract_spending;
  Currency download_spending;
  Currency storage_spending;
  Currency upload_spending;
  Currency unspent;
};

} // namespace renter::model
