#pragma once

#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace strata::coordinator {

/*
  Single writer per source locator.

  A claim is a logical token, not a held mutex: the internal mutex only
  guards the claimed set, so store calls made while a claim is held
  never run under a lock. A second ingest of the same locator waits
  until the first releases.
*/
class LocatorClaims {
 public:
  class Claim {
   public:
    Claim(LocatorClaims& owner, std::string locator) : owner_(&owner), locator_(std::move(locator)) {
    }
    ~Claim();

    Claim(const Claim&)            = delete;
    Claim& operator=(const Claim&) = delete;

    Claim(Claim&& other) noexcept : owner_(other.owner_), locator_(std::move(other.locator_)) {
      other.owner_ = nullptr;
    }
    Claim& operator=(Claim&&) = delete;

   private:
    LocatorClaims* owner_;
    std::string    locator_;
  };

  Claim Acquire(const std::string& locator);

 private:
  void Release(const std::string& locator);

  std::mutex              mutex_;
  std::condition_variable released_;
  std::set<std::string>   claimed_;
};

} // namespace strata::coordinator
