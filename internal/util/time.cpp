#include "time.hpp"

namespace strata::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t ToMillis(const google::protobuf::Duration& d, uint64_t fallback_ms) {
  const int64_t ms = d.seconds() * 1000 + d.nanos() / 1000000;
  if (ms <= 0) {
    return fallback_ms;
  }
  return static_cast<uint64_t>(ms);
}

std::chrono::milliseconds ToChrono(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(ToMillis(d, static_cast<uint64_t>(fallback.count())));
}

} // namespace strata::util
