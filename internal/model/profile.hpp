#pragma once

#include <cstdint>
#include <string_view>

namespace renter::model {

using BlockHeight = std::uint64_t;

enum class Profile : std::uint8_t {
  kStandard = 0,
  kDev      = 1,
  kTesting  = 2,
};

/*
  Numeric minimums fixed by the deployment profile. Chosen once at startup
  and passed around by value.
*/
struct ProfileConstants {
  // Hosts used when the operator does not specify a host count.
  std::uint64_t recommended_hosts;
  // Smallest host count accepted from the operator.
  std::uint64_t required_hosts;
  // Smallest renew window accepted from the operator.
  BlockHeight   required_renew_window;
  // Bytes per sector; a contract's size is sectors * sector_size.
  std::uint64_t sector_size;
};

constexpr ProfileConstants ConstantsFor(Profile profile) {
  switch (profile) {
    case Profile::kDev:
      return {4, 1, 1, std::uint64_t{1} << 18};
    case Profile::kTesting:
      return {2, 1, 1, std::uint64_t{1} << 12};
    case Profile::kStandard:
    default:
      return {30, 24, 288, std::uint64_t{1} << 22};
  }
}

constexpr std::string_view ToString(Profile profile) {
  switch (profile) {
    case Profile::kDev:
      return "dev";
    case Profile::kTesting:
      return "testing";
    case Profile::kStandard:
    default:
      return "standard";
  }
}

// Empty selects the standard profile. Throws std::invalid_argument on an
// unknown name.
Profile ParseProfile(std::string_view name);

} // namespace renter::model
