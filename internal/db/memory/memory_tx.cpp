#include "memory_tx.hpp"

#include <stdexcept>

namespace strata::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  if (!working_) {
    working_ = repo_.committed_; // tables stay shared until edited
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : repo_.committed_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  if (working_) {
    repo_.committed_ = std::move(*working_);
    working_.reset();
  }
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace strata::db::memory
