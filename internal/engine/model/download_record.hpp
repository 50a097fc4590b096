#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace renter::engine::model {

struct DownloadRecord {
  std::string siapath;
  std::string destination;

  std::uint64_t filesize = 0;
  std::uint64_t received = 0;

  renter::util::TimePoint start_time{};
};

} // namespace renter::engine::model
