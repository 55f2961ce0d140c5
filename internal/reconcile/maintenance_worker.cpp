#include "maintenance_worker.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace strata::reconcile {

using observability::StringField;

namespace {
constexpr uint64_t kMaxSleepMs = 1000;
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::AddJob(std::string name, uint64_t interval_ms, Job job) {
  jobs_.push_back({std::move(name), std::max<uint64_t>(1, interval_ms), 0, std::move(job)});
}

void MaintenanceWorker::Start() {
  if (thread_.joinable()) return;
  {
    std::lock_guard lock(mutex_);
    stop_ = false;
  }
  thread_ = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void MaintenanceWorker::RunJob(Entry& entry, uint64_t now_ms) {
  try {
    entry.job(now_ms);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR("maintenance job failed", {StringField("job", entry.name), StringField("error", e.what())});
  }
  entry.next_run_ms = now_ms + entry.interval_ms;
}

void MaintenanceWorker::Run() {
  std::unique_lock lock(mutex_);
  while (!stop_) {
    const uint64_t now  = util::NowMillis();
    uint64_t       wake = now + kMaxSleepMs;

    lock.unlock();
    for (auto& entry : jobs_) {
      if (entry.next_run_ms <= now) RunJob(entry, now);
      wake = std::min(wake, entry.next_run_ms);
    }
    lock.lock();

    const auto sleep_ms = wake > util::NowMillis() ? wake - util::NowMillis() : 0;
    cv_.wait_for(lock, std::chrono::milliseconds(sleep_ms), [this] { return stop_; });
  }
}

} // namespace strata::reconcile
