#include "locator_claims.hpp"

namespace strata::coordinator {

LocatorClaims::Claim::~Claim() {
  if (owner_ != nullptr) owner_->Release(locator_);
}

LocatorClaims::Claim LocatorClaims::Acquire(const std::string& locator) {
  std::unique_lock<std::mutex> lock(mutex_);
  released_.wait(lock, [&] { return claimed_.count(locator) == 0; });
  claimed_.insert(locator);
  return Claim(*this, locator);
}

void LocatorClaims::Release(const std::string& locator) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    claimed_.erase(locator);
  }
  released_.notify_all();
}

} // namespace strata::coordinator
