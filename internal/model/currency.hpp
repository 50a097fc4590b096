#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace renter::model {

/*
  Non-negative amount of hastings, the smallest currency unit.

  Amounts routinely exceed 64 bits (1 SC = 10^24 H), so the value is an
  arbitrary-precision integer that never goes negative.
*/
class Currency {
 public:
  Currency();
  explicit Currency(std::uint64_t hastings);

  // Accepts a plain integer number of hastings ("1000") or a decimal with a
  // unit suffix ("1.5KS", "250mS", "10H"). The result must be a whole number
  // of hastings.
  static std::optional<Currency> Parse(std::string_view text);

  // Base-10 hastings without leading zeros; "0" for zero.
  std::string ToString() const {
    return value_.str();
  }

  bool IsZero() const {
    return value_.is_zero();
  }

  Currency operator+(const Currency& other) const;

  // Throws std::underflow_error when other is larger.
  Currency operator-(const Currency& other) const;

  Currency SaturatingSub(const Currency& other) const;

  // Floor division. Throws std::invalid_argument on a zero divisor.
  Currency DivideBy(std::uint64_t divisor) const;

  bool operator==(const Currency& other) const {
    return value_ == other.value_;
  }
  std::strong_ordering operator<=>(const Currency& other) const;

 private:
  using Value = boost::multiprecision::cpp_int;

  explicit Currency(Value value);

  Value value_;
};

} // namespace renter::model
