#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace strata::util {

/*
  Fixed-size pool over a blocking task queue.

  Bounds parallelism of chunk uploads and hybrid sub-queries. Submit
  returns a future; exceptions thrown by the task travel through it.
  Shutdown drains queued tasks before joining.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using R   = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto fut  = task->get_future();
    Enqueue([task] { (*task)(); });
    return fut;
  }

  void Shutdown();

  std::size_t Size() const {
    return threads_.size();
  }

 private:
  void Enqueue(std::function<void()> job);
  void Run();

  std::mutex                        mutex_;
  std::condition_variable           cv_;
  std::queue<std::function<void()>> queue_;
  bool                              shutdown_ = false;
  std::vector<std::thread>          threads_;
};

} // namespace strata::util
