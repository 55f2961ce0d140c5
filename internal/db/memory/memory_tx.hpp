#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace strata::db::memory {

/*
  Transaction = exclusive repository lock + lazy working copy.

  The repository mutex is held for the lifetime of the transaction, so
  transactions are serializable. The first write takes a shallow copy of
  the committed state; each table is then copied only when it is first
  edited (SharedTable::Edit). Read-only transactions never copy. Commit
  publishes the working copy, rollback discards it.

  Do not open a second transaction on the same thread while one is live.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                      repo_;
  std::unique_lock<std::mutex>           lock_;
  std::optional<MemoryRepository::State> working_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace strata::db::memory
