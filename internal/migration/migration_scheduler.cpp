#include "migration_scheduler.hpp"

#include <algorithm>
#include <thread>

namespace strata::migration {

MigrationScheduler::MigrationScheduler(double max_per_second)
    : interval_(max_per_second > 0.0 ? std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / max_per_second))
                                     : Clock::duration::zero()),
      next_slot_(Clock::now()) {
}

Submission MigrationScheduler::Submit(const std::string& record_id, strata::engine::v1::Strategy target,
                                      uint32_t policy_version) {
  MigrationTask task;
  task.record_id      = record_id;
  task.target         = target;
  task.policy_version = policy_version;
  task.done           = std::make_shared<std::promise<MigrationResult>>();

  Submission submission{task.done->get_future(), task.cancel};
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      task.done->set_value({record_id, Outcome::kCancelled, "scheduler stopped", 0.0});
      return submission;
    }
    if (consumers_ == 0) {
      task.done->set_value({record_id, Outcome::kFailed, "no migration worker running", 0.0});
      return submission;
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return submission;
}

std::optional<MigrationTask> MigrationScheduler::Dequeue() {
  Clock::time_point slot;
  MigrationTask     task;
  {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
    if (shutdown_) return std::nullopt;

    task = std::move(queue_.front());
    queue_.pop_front();

    slot       = std::max(Clock::now(), next_slot_);
    next_slot_ = slot + interval_;
  }
  std::this_thread::sleep_until(slot);
  return task;
}

void MigrationScheduler::Shutdown() {
  std::deque<MigrationTask> dropped;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    dropped.swap(queue_);
  }
  cv_.notify_all();
  for (auto& task : dropped) {
    task.done->set_value({task.record_id, Outcome::kCancelled, "scheduler stopped", 0.0});
  }
}

void MigrationScheduler::AttachConsumer() {
  std::lock_guard lock(mutex_);
  ++consumers_;
}

void MigrationScheduler::DetachConsumer() {
  std::lock_guard lock(mutex_);
  if (consumers_ > 0) --consumers_;
}

} // namespace strata::migration
