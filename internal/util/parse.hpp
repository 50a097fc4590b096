#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace renter::util {

/*
  Strict unsigned parse: every character must be a decimal digit and the
  value must fit in 64 bits. No sign, whitespace or trailing text.
*/
std::optional<std::uint64_t> ParseUint64(std::string_view text);

} // namespace renter::util
