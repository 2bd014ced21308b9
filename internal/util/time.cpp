#include "time.hpp"

namespace household::util {

WallTimePoint WallNow() {
  return WallClock::now();
}

google::protobuf::Timestamp ToProto(WallTimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

// Sub-millisecond remainders are truncated.
Millis FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Millis>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

} // namespace household::util
