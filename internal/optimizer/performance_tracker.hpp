#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "strata/engine/v1.hpp"

namespace strata::optimizer {

struct TrackerOptions {
  uint64_t flush_interval_ms    = 1000;
  uint64_t sample_retention_ms  = 30ULL * 24 * 3600 * 1000;
  uint64_t window_ms            = 24ULL * 3600 * 1000;
  double   latency_threshold_ms = 500.0;
  // Samples held while the repository is unavailable; the oldest go first.
  std::size_t max_buffered_samples = 10000;
};

/*
  Buffers query observations off the request path.

  Record and RecordAccess only append under a short lock; a background
  thread (Start) or an explicit Flush writes them out. Access counters
  are relaxed: increments lost to a failed flush are not retried.
  Samples from a failed flush are requeued up to max_buffered_samples.
*/
class PerformanceTracker {
 public:
  PerformanceTracker(db::Repository& repo, TrackerOptions options);
  ~PerformanceTracker();

  PerformanceTracker(const PerformanceTracker&)            = delete;
  PerformanceTracker& operator=(const PerformanceTracker&) = delete;

  void Start();
  void Stop();

  void Record(db::model::PerformanceSample sample);
  void RecordAccess(const std::vector<std::string>& record_ids, uint64_t now_ms);

  // Writes everything buffered so far.
  void Flush();

  // Deletes samples older than the retention period.
  void SweepRetention(uint64_t now_ms);

  strata::engine::v1::PerformanceReport Report(uint64_t now_ms);

  const TrackerOptions& Options() const {
    return options_;
  }

 private:
  struct Access {
    uint64_t count   = 0;
    uint64_t last_ms = 0;
  };

  void Run();
  // Caller holds mutex_. Returns how many samples were dropped.
  std::size_t TrimBuffer();

  db::Repository& repo_;
  TrackerOptions  options_;

  std::mutex                                mutex_;
  std::condition_variable                   cv_;
  std::deque<db::model::PerformanceSample>  samples_;
  std::map<std::string, Access>             access_;
  bool                                      stop_ = false;
  std::thread                               thread_;
};

} // namespace strata::optimizer
