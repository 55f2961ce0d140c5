#include "reconciler.hpp"

#include "internal/db/api/db_errors.hpp"
#include "internal/model/strategy.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/retry.hpp"
#include "internal/util/uuid.hpp"

namespace strata::reconcile {

namespace v1 = strata::engine::v1;

using observability::IntField;
using observability::StringField;

Reconciler::Reconciler(db::Repository& repo, legs::LegStore& legs, consistency::ConsistencyMapper& mapper,
                       ReconcilerOptions options)
    : repo_(repo), legs_(legs), mapper_(mapper), options_(options) {
}

ReconcileReport Reconciler::RunOnce(uint64_t now_ms) {
  std::vector<db::model::RepairTask> due;
  {
    auto tx = repo_.Begin();
    due     = repo_.ListRepairTasks(*tx, v1::REPAIR_STATE_PENDING, now_ms);
    tx->Rollback();
  }

  ReconcileReport report;
  for (const auto& task : due) {
    ++report.attempted;
    bool fatal = false;
    if (Attempt(task, now_ms, fatal)) {
      ++report.repaired;
    } else {
      ++report.failed;
      if (fatal) ++report.fatal;
    }
  }
  return report;
}

bool Reconciler::Attempt(const db::model::RepairTask& task, uint64_t now_ms, bool& fatal) {
  std::optional<db::model::ContentRecord> record;
  {
    auto tx = repo_.Begin();
    record  = repo_.GetRecord(*tx, task.record_id);
    tx->Rollback();
  }
  if (!record) {
    auto tx = repo_.Begin();
    db::ThrowIfDbError(repo_.DeleteRepairTask(*tx, task.record_id), "drop repair task");
    tx->Commit();
    STRATA_LOG_WARN("repair task without record dropped", {StringField("record_id", task.record_id)});
    return false;
  }

  legs::LegContext ctx;
  ctx.record_id      = record->id;
  ctx.content        = task.content;
  ctx.content_hash   = record->content_hash;
  ctx.title          = record->title;
  ctx.domain         = record->domain;
  ctx.content_type   = record->content_type;
  ctx.now_ms         = now_ms;
  ctx.ingested_at_ms = record->created_at_ms;

  std::string error;
  try {
    const auto written = legs_.Write(task.missing_legs, ctx);
    if (mapper_.CompleteRepair(record->id, written, now_ms)) return true;
    error = written.error.empty() ? "read-back verification failed" : written.error;
  } catch (const std::exception& e) {
    error = e.what();
  }

  fatal = ChargeFailure(record->id, error, now_ms);
  return false;
}

bool Reconciler::ChargeFailure(const std::string& record_id, const std::string& error, uint64_t now_ms) {
  const util::RetryPolicy backoff{options_.max_attempts, options_.initial_backoff_ms, 2.0, options_.max_backoff_ms};

  auto tx   = repo_.Begin();
  auto task = repo_.GetRepairTask(*tx, record_id);
  if (!task) return false;

  task->attempts += 1;
  task->last_error    = error;
  task->updated_at_ms = now_ms;

  const bool exhausted = task->attempts >= options_.max_attempts;
  if (!exhausted) {
    task->next_attempt_at_ms = now_ms + util::BackoffMs(backoff, task->attempts);
    db::ThrowIfDbError(repo_.UpsertRepairTask(*tx, *task), "reschedule repair");
    tx->Commit();
    STRATA_LOG_WARN("repair attempt failed", {StringField("record_id", record_id), IntField("attempt", task->attempts),
                                              StringField("error", error)});
    return false;
  }

  task->state = v1::REPAIR_STATE_FATAL;
  db::ThrowIfDbError(repo_.UpsertRepairTask(*tx, *task), "mark repair fatal");

  if (auto record = repo_.GetRecord(*tx, record_id)) {
    const auto expected   = record->version;
    record->needs_review  = true;
    record->version       = expected + 1;
    record->updated_at_ms = now_ms;
    db::ThrowIfDbError(repo_.UpdateRecord(*tx, *record, expected), "flag record for review");
  }

  db::model::Incident incident;
  incident.id            = util::NewId();
  incident.record_id     = record_id;
  incident.kind          = "repair_exhausted";
  incident.detail        = "missing legs " + std::to_string(task->missing_legs) + " after " + std::to_string(task->attempts) +
                    " attempts: " + error;
  incident.created_at_ms = now_ms;
  db::ThrowIfDbError(repo_.InsertIncident(*tx, incident), "record incident");
  tx->Commit();

  STRATA_LOG_ERROR("repair exhausted; record flagged for review",
                   {StringField("record_id", record_id), IntField("attempts", task->attempts), StringField("error", error)});
  return true;
}

} // namespace strata::reconcile
