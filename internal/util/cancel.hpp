#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace strata::util {

/*
  Cooperative cancellation flag shared between a task and its owner.
  Copies observe the same flag.
*/
class CancelToken {
 public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {
  }

  void Cancel() const {
    flag_->store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return flag_->load(std::memory_order_acquire);
  }

  void ThrowIfCancelled(const std::string& what) const {
    if (IsCancelled()) {
      throw Cancelled(what + ": cancelled");
    }
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace strata::util
