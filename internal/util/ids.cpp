#include "ids.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace renter::util {

Hash GenerateHash() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  Hash id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  return id;
}

std::string ToHex(const Hash& id) {
  std::ostringstream oss;

  for (auto b : id) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return oss.str();
}

std::string GenerateHexId() {
  return ToHex(GenerateHash());
}

} // namespace renter::util
