#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

#include "internal/util/errors.hpp"

namespace strata::util {

struct RetryPolicy {
  uint32_t max_attempts       = 3;
  uint64_t initial_backoff_ms = 50;
  double   multiplier         = 2.0;
  uint64_t max_backoff_ms     = 2000;
};

// Delay before the given retry (1-based): initial * multiplier^(attempt-1), capped.
inline uint64_t BackoffMs(const RetryPolicy& policy, uint32_t attempt) {
  double delay = static_cast<double>(policy.initial_backoff_ms);
  for (uint32_t i = 1; i < attempt; ++i) {
    delay *= policy.multiplier;
    if (delay >= static_cast<double>(policy.max_backoff_ms)) break;
  }
  return std::min<uint64_t>(static_cast<uint64_t>(delay), policy.max_backoff_ms);
}

/*
  Runs fn, retrying only TransientStoreError with exponential backoff.
  Other exceptions propagate immediately; the last transient error is
  rethrown once attempts are exhausted.
*/
template <typename Fn>
auto RetryTransient(const RetryPolicy& policy, Fn&& fn) -> decltype(fn()) {
  const uint32_t attempts = std::max<uint32_t>(1, policy.max_attempts);
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const TransientStoreError&) {
      if (attempt >= attempts) throw;
      std::this_thread::sleep_for(std::chrono::milliseconds(BackoffMs(policy, attempt)));
    }
  }
}

} // namespace strata::util
