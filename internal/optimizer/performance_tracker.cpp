#include "performance_tracker.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"

namespace strata::optimizer {

using observability::IntField;
using observability::StringField;

PerformanceTracker::PerformanceTracker(db::Repository& repo, TrackerOptions options) : repo_(repo), options_(options) {
}

PerformanceTracker::~PerformanceTracker() {
  Stop();
}

void PerformanceTracker::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) return;
  stop_   = false;
  thread_ = std::thread([this] { Run(); });
}

void PerformanceTracker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  Flush();
}

void PerformanceTracker::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_) {
    cv_.wait_for(lock, std::chrono::milliseconds(options_.flush_interval_ms), [this] { return stop_; });
    if (stop_) break;
    lock.unlock();
    Flush();
    lock.lock();
  }
}

void PerformanceTracker::Record(db::model::PerformanceSample sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  samples_.push_back(std::move(sample));
  TrimBuffer();
}

std::size_t PerformanceTracker::TrimBuffer() {
  const std::size_t cap = std::max<std::size_t>(1, options_.max_buffered_samples);
  if (samples_.size() <= cap) return 0;
  const std::size_t excess = samples_.size() - cap;
  samples_.erase(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(excess));
  return excess;
}

void PerformanceTracker::RecordAccess(const std::vector<std::string>& record_ids, uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& id : record_ids) {
    auto& a = access_[id];
    a.count += 1;
    a.last_ms = std::max(a.last_ms, now_ms);
  }
}

void PerformanceTracker::Flush() {
  std::vector<db::model::PerformanceSample> samples;
  std::map<std::string, Access>             access;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    samples.assign(std::make_move_iterator(samples_.begin()), std::make_move_iterator(samples_.end()));
    samples_.clear();
    access.swap(access_);
  }

  if (!samples.empty()) {
    try {
      auto tx = repo_.Begin();
      db::ThrowIfDbError(repo_.InsertSamples(*tx, samples), "insert samples");
      tx->Commit();
    } catch (const std::exception& e) {
      std::size_t dropped = 0;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.insert(samples_.begin(), std::make_move_iterator(samples.begin()), std::make_move_iterator(samples.end()));
        dropped = TrimBuffer();
      }
      STRATA_LOG_WARN("sample flush failed; requeued", {IntField("samples", static_cast<int64_t>(samples.size() - dropped)),
                                                        IntField("dropped", static_cast<int64_t>(dropped)), StringField("error", e.what())});
    }
  }

  if (access.empty()) return;

  // queries per hour over the last flush interval
  const double hours = std::max<double>(1.0, static_cast<double>(options_.flush_interval_ms)) / 3600000.0;
  try {
    auto tx = repo_.Begin();
    for (const auto& [id, a] : access) {
      auto res = repo_.MergeAccessStats(*tx, id, a.count, a.last_ms, static_cast<double>(a.count) / hours);
      if (res.code != db::ErrorCode::NotFound) db::ThrowIfDbError(res, "merge access stats");
    }
    tx->Commit();
  } catch (const std::exception& e) {
    STRATA_LOG_WARN("access stats dropped", {IntField("records", static_cast<int64_t>(access.size())), StringField("error", e.what())});
  }
}

void PerformanceTracker::SweepRetention(uint64_t now_ms) {
  if (now_ms <= options_.sample_retention_ms) return;
  auto tx = repo_.Begin();
  db::ThrowIfDbError(repo_.DeleteSamplesBefore(*tx, now_ms - options_.sample_retention_ms), "sweep samples");
  tx->Commit();
}

strata::engine::v1::PerformanceReport PerformanceTracker::Report(uint64_t now_ms) {
  const uint64_t since = now_ms > options_.window_ms ? now_ms - options_.window_ms : 0;

  std::vector<db::model::PerformanceSample> samples;
  {
    auto tx = repo_.Begin();
    samples = repo_.ListSamples(*tx, since);
    tx->Rollback();
  }

  struct Totals {
    double   latency = 0.0;
    uint64_t total   = 0;
    uint64_t slow    = 0;
  };
  std::map<std::string, Totals> by_domain;
  for (const auto& s : samples) {
    auto& t = by_domain[s.domain.empty() ? "all" : s.domain];
    t.latency += s.latency_ms;
    t.total += 1;
    if (s.latency_ms > options_.latency_threshold_ms) t.slow += 1;
  }

  strata::engine::v1::PerformanceReport report;
  report.set_window_ms(options_.window_ms);
  for (const auto& [domain, t] : by_domain) {
    auto* d = report.add_domains();
    d->set_domain(domain);
    d->set_avg_latency_ms(t.latency / static_cast<double>(t.total));
    d->set_total_queries(t.total);
    d->set_slow_queries(t.slow);
  }
  return report;
}

} // namespace strata::optimizer
