#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace strata::reconcile {

/*
  Single background thread running periodic maintenance jobs
  (repair, orphan sweep, garbage collection, optimizer evaluation).

  A job that throws is logged and retried on its next period; failures
  never leave this thread.
*/
class MaintenanceWorker {
 public:
  using Job = std::function<void(uint64_t now_ms)>;

  MaintenanceWorker() = default;
  ~MaintenanceWorker();

  MaintenanceWorker(const MaintenanceWorker&)            = delete;
  MaintenanceWorker& operator=(const MaintenanceWorker&) = delete;

  // Register before Start.
  void AddJob(std::string name, uint64_t interval_ms, Job job);

  void Start();
  void Stop();

 private:
  struct Entry {
    std::string name;
    uint64_t    interval_ms = 0;
    uint64_t    next_run_ms = 0;
    Job         job;
  };

  void Run();
  void RunJob(Entry& entry, uint64_t now_ms);

  std::vector<Entry>      jobs_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stop_ = false;
  std::thread             thread_;
};

} // namespace strata::reconcile
