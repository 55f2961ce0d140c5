#include "worker_pool.hpp"

#include <stdexcept>

namespace strata::util {

WorkerPool::WorkerPool(std::size_t threads) {
  if (threads == 0) threads = 1;
  threads_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

void WorkerPool::Enqueue(std::function<void()> job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw std::runtime_error("worker pool is shut down");
    }
    queue_.push(std::move(job));
  }
  cv_.notify_one();
}

void WorkerPool::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::Run() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      if (shutdown_ && queue_.empty()) return;
      job = std::move(queue_.front());
      queue_.pop();
    }
    // packaged_task stores any exception in its future
    job();
  }
}

} // namespace strata::util
