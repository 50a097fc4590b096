#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace renter::util {

/*
  Random identifiers

  Contract ids and sector Merkle roots are 32 random bytes rendered as
  64 lowercase hex characters. Master keys stay raw.
*/

using Hash = std::array<uint8_t, 32>;

Hash GenerateHash();

std::string ToHex(const Hash& id);

// Shorthand for ToHex(GenerateHash()).
std::string GenerateHexId();

} // namespace renter::util
