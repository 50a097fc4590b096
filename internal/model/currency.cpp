#include "currency.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <stdexcept>
#include <utility>

namespace renter::model {

namespace {

struct Unit {
  std::string_view suffix;
  std::size_t      exponent;
};

// Longer suffixes first so "SC" is not mistaken for a bare "C".
constexpr std::array<Unit, 10> kUnits = {{
    {"pS", 12},
    {"nS", 15},
    {"uS", 18},
    {"mS", 21},
    {"SC", 24},
    {"KS", 27},
    {"MS", 30},
    {"GS", 33},
    {"TS", 36},
    {"H", 0},
}};

bool AllDigits(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

using BigInt = boost::multiprecision::cpp_int;

// Leading zeros would make the parser read the digits as octal.
BigInt FromDigits(std::string_view digits) {
  const auto first = digits.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return BigInt(0);
  }
  return BigInt(std::string(digits.substr(first)).c_str());
}

} // namespace

Currency::Currency() = default;

Currency::Currency(std::uint64_t hastings) : value_(hastings) {
}

Currency::Currency(Value value) : value_(std::move(value)) {
}

std::optional<Currency> Currency::Parse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  if (AllDigits(text)) {
    return Currency(FromDigits(text));
  }

  const Unit* unit = nullptr;
  for (const auto& candidate : kUnits) {
    if (text.size() > candidate.suffix.size() && text.ends_with(candidate.suffix)) {
      unit = &candidate;
      break;
    }
  }
  if (unit == nullptr) {
    return std::nullopt;
  }

  const auto number = text.substr(0, text.size() - unit->suffix.size());
  const auto dot    = number.find('.');
  const auto whole  = number.substr(0, dot);
  auto       frac   = dot == std::string_view::npos ? std::string_view{} : number.substr(dot + 1);
  if (whole.empty() || !AllDigits(whole) || !AllDigits(frac)) {
    return std::nullopt;
  }
  if (dot != std::string_view::npos && frac.empty()) {
    return std::nullopt;
  }

  // More fractional digits than the unit scale: the excess must be zeros.
  if (frac.size() > unit->exponent) {
    if (frac.find_first_not_of('0', unit->exponent) != std::string_view::npos) {
      return std::nullopt;
    }
    frac = frac.substr(0, unit->exponent);
  }

  std::string digits(whole);
  digits.append(frac);
  const auto scale = static_cast<unsigned>(unit->exponent - frac.size());
  return Currency(Value(FromDigits(digits) * boost::multiprecision::pow(Value(10), scale)));
}

Currency Currency::operator+(const Currency& other) const {
  return Currency(Value(value_ + other.value_));
}

Currency Currency::operator-(const Currency& other) const {
  if (value_ < other.value_) {
    throw std::underflow_error("currency subtraction underflow: " + ToString() + " - " + other.ToString());
  }
  return Currency(Value(value_ - other.value_));
}

Currency Currency::SaturatingSub(const Currency& other) const {
  if (value_ <= other.value_) {
    return Currency();
  }
  return Currency(Value(value_ - other.value_));
}

Currency Currency::DivideBy(std::uint64_t divisor) const {
  if (divisor == 0) {
    throw std::invalid_argument("currency division by zero");
  }
  return Currency(Value(value_ / divisor));
}

std::strong_ordering Currency::operator<=>(const Currency& other) const {
  const int cmp = value_.compare(other.value_);
  if (cmp < 0) return std::strong_ordering::less;
  if (cmp > 0) return std::strong_ordering::greater;
  return std::strong_ordering::equal;
}

} // namespace renter::model
