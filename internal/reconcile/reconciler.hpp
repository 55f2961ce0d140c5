#pragma once

#include <cstdint>

#include "internal/consistency/consistency_mapper.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/legs/leg_store.hpp"

namespace strata::reconcile {

struct ReconcilerOptions {
  uint32_t max_attempts       = 3;
  uint64_t initial_backoff_ms = 1000;
  uint64_t max_backoff_ms     = 60 * 1000;
};

struct ReconcileReport {
  uint64_t attempted = 0;
  uint64_t repaired  = 0;
  uint64_t failed    = 0;
  uint64_t fatal     = 0;
};

/*
  Drives degraded records back to READY.

  Each due repair task rewrites its missing legs from the stored content
  and hands them to the consistency mapper. A failed attempt is
  rescheduled with exponential backoff; after max_attempts the task
  turns FATAL, the record is flagged for review and an incident is
  recorded. The record itself is never deleted.
*/
class Reconciler {
 public:
  Reconciler(db::Repository& repo, legs::LegStore& legs, consistency::ConsistencyMapper& mapper, ReconcilerOptions options);

  ReconcileReport RunOnce(uint64_t now_ms);

 private:
  // true when the record was repaired; false when the attempt was charged
  bool Attempt(const db::model::RepairTask& task, uint64_t now_ms, bool& fatal);

  bool ChargeFailure(const std::string& record_id, const std::string& error, uint64_t now_ms);

  db::Repository&                 repo_;
  legs::LegStore&                 legs_;
  consistency::ConsistencyMapper& mapper_;
  ReconcilerOptions               options_;
};

} // namespace strata::reconcile
