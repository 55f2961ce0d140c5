#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>

#include "migration_task.hpp"

namespace strata::migration {

struct Submission {
  std::future<MigrationResult> result;
  util::CancelToken            cancel;
};

/*
  Blocking queue for migration workers with a global start-rate limit.

  Dequeue hands out at most max_per_second tasks per second across all
  workers; 0 disables the limit. Tasks left in the queue at shutdown
  resolve as cancelled. A submission made while no worker is attached
  resolves as failed instead of waiting for one.
*/
class MigrationScheduler {
 public:
  explicit MigrationScheduler(double max_per_second);

  Submission Submit(const std::string& record_id, strata::engine::v1::Strategy target, uint32_t policy_version);

  // blocking wait; nullopt after shutdown
  std::optional<MigrationTask> Dequeue();

  void Shutdown();

  // Called by workers around their run loop.
  void AttachConsumer();
  void DetachConsumer();

 private:
  using Clock = std::chrono::steady_clock;

  std::mutex                mutex_;
  std::condition_variable   cv_;
  std::deque<MigrationTask> queue_;
  bool                      shutdown_  = false;
  std::size_t               consumers_ = 0;

  Clock::duration   interval_;
  Clock::time_point next_slot_;
};

} // namespace strata::migration
