#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include "migration_scheduler.hpp"

namespace strata::consistency {
class ConsistencyMapper;
}

namespace strata::migration {

/*
  Background workers that execute migrations through the mapper.

  A failed migration is reported through the task's future; the record
  itself keeps its original location.
*/
class MigrationWorker {
 public:
  MigrationWorker(MigrationScheduler& scheduler, consistency::ConsistencyMapper& mapper, std::size_t threads);
  ~MigrationWorker();

  void Start();
  void Stop();

 private:
  void Run();
  MigrationResult Execute(const MigrationTask& task);

  MigrationScheduler&             scheduler_;
  consistency::ConsistencyMapper& mapper_;
  std::size_t                     threads_;

  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace strata::migration
