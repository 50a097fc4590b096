#include "profile.hpp"

#include <stdexcept>
#include <string>

namespace renter::model {

Profile ParseProfile(std::string_view name) {
  if (name.empty() || name == "standard") {
    return Profile::kStandard;
  }
  if (name == "dev") {
    return Profile::kDev;
  }
  if (name == "testing") {
    return Profile::kTesting;
  }
  throw std::invalid_argument("unknown profile '" + std::string(name) + "', expected standard, dev or testing");
}

} // namespace renter::model
