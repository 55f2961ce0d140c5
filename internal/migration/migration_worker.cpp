#include "migration_worker.hpp"

#include <chrono>

#include "internal/consistency/consistency_mapper.hpp"
#include "internal/model/strategy.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace strata::migration {

using observability::StringField;

MigrationWorker::MigrationWorker(MigrationScheduler& scheduler, consistency::ConsistencyMapper& mapper, std::size_t threads)
    : scheduler_(scheduler), mapper_(mapper), threads_(threads == 0 ? 1 : threads) {
}

MigrationWorker::~MigrationWorker() {
  Stop();
}

void MigrationWorker::Start() {
  if (running_.exchange(true)) return;
  scheduler_.AttachConsumer();
  for (std::size_t i = 0; i < threads_; ++i) {
    workers_.emplace_back(&MigrationWorker::Run, this);
  }
}

void MigrationWorker::Stop() {
  const bool was_running = running_.exchange(false);
  scheduler_.Shutdown();
  if (was_running) scheduler_.DetachConsumer();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
}

void MigrationWorker::Run() {
  while (running_) {
    auto task = scheduler_.Dequeue();
    if (!task) break;
    task->done->set_value(Execute(*task));
  }
}

MigrationResult MigrationWorker::Execute(const MigrationTask& task) {
  observability::SpanScope span("MigrationWorker.Execute");
  span.SetAttribute("record_id", task.record_id);
  span.SetAttribute("target", model::ToString(task.target));

  const auto      started = std::chrono::steady_clock::now();
  MigrationResult result;
  result.record_id = task.record_id;

  if (task.cancel.IsCancelled()) {
    result.outcome = Outcome::kCancelled;
    return result;
  }

  try {
    switch (mapper_.Migrate(task.record_id, task.target, task.policy_version, task.cancel, util::NowMillis())) {
      case consistency::MigrationOutcome::kSucceeded:
        result.outcome = Outcome::kSucceeded;
        break;
      case consistency::MigrationOutcome::kUnchanged:
        result.outcome = Outcome::kUnchanged;
        break;
      case consistency::MigrationOutcome::kCancelled:
        result.outcome = Outcome::kCancelled;
        break;
    }
  } catch (const std::exception& e) {
    result.outcome = Outcome::kFailed;
    result.error   = e.what();
    span.RecordException(e.what());
    STRATA_LOG_WARN("migration failed", {StringField("record_id", task.record_id), StringField("error", e.what())});
  }

  result.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveMigrationDurationMs(ToString(result.outcome), result.duration_ms);
  return result;
}

} // namespace strata::migration
