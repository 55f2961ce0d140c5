#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace strata::util {

/*
  Time utilities. Components that make time-based decisions take an
  explicit now_ms so tests can drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Duration helpers for config values; unset durations map to the fallback.
uint64_t                  ToMillis(const google::protobuf::Duration& d, uint64_t fallback_ms);
std::chrono::milliseconds ToChrono(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace strata::util
