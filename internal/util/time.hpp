#pragma once

#include <chrono>

#include "google/protobuf/timestamp.pb.h"

namespace renter::util {

/*
  Time utilities: wall clock, proto timestamps and elapsed time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

double MillisSince(std::chrono::steady_clock::time_point started_at);

} // namespace renter::util
