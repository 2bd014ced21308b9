#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace household::util {

/*
  Time utilities.

  Timers, expiries and event stamps use the monotonic clock. The wall clock
  is only used when a snapshot is exported for humans.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

using WallClock     = std::chrono::system_clock;
using WallTimePoint = WallClock::time_point;

WallTimePoint WallNow();

google::protobuf::Timestamp ToProto(WallTimePoint tp);

Millis FromProto(const google::protobuf::Duration& d);

} // namespace household::util
