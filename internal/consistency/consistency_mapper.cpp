#include "consistency_mapper.hpp"

#include <exception>
#include <utility>

#include "internal/db/api/db_errors.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/strategy.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/uuid.hpp"

namespace strata::consistency {

namespace v1 = strata::engine::v1;

using observability::IntField;
using observability::StringField;

namespace {

constexpr unsigned kAllLegs[] = {model::kLegBlob, model::kLegVectors, model::kLegTableRow};

std::pair<std::string, std::string> LegRef(unsigned leg, const legs::Location& l) {
  switch (leg) {
    case model::kLegBlob:
      return {l.blob_hash, ""};
    case model::kLegVectors:
      return {l.vector_batch_id, l.vector_collection};
    case model::kLegTableRow:
      return {l.table_row_id, l.table_name};
    default:
      return {};
  }
}

// True when the record's live pointer still references this leg.
bool IsLive(const db::model::ContentRecord& r, unsigned leg, const std::string& ref) {
  switch (leg) {
    case model::kLegBlob:
      return r.blob_hash == ref;
    case model::kLegVectors:
      return r.vector_batch_id == ref;
    case model::kLegTableRow:
      return r.table_row_id == ref;
    default:
      return false;
  }
}

} // namespace

ConsistencyMapper::ConsistencyMapper(db::Repository& repo, legs::LegStore& legs, ConsistencyOptions options)
    : repo_(repo), legs_(legs), options_(std::move(options)) {
}

std::optional<db::model::ContentRecord> ConsistencyMapper::PublishIngest(db::model::ContentRecord record,
                                                                         const legs::WrittenLegs& written,
                                                                         const std::string& content, uint64_t now_ms) {
  const unsigned failed = written.Failed();
  written.location.ApplyTo(record, written.written);
  record.status =
      model::CheckedTransition(record.id, record.status, failed != 0 ? v1::RECORD_STATUS_DEGRADED : v1::RECORD_STATUS_READY);

  const bool published = util::RetryTransient(options_.retry, [&] {
    auto tx  = repo_.Begin();
    auto res = repo_.InsertRecord(*tx, record);
    if (db::IsUniqueViolation(res)) {
      tx->Rollback();
      return false;
    }
    db::ThrowIfDbError(res, "insert record");

    if (written.written & model::kLegVectors) {
      db::ThrowIfDbError(repo_.CompleteBatch(*tx, written.location.vector_batch_id, now_ms), "complete batch");
      db::ThrowIfDbError(repo_.InsertVectorMappings(*tx, written.mappings), "insert mappings");
    }

    if (failed != 0) {
      db::model::RepairTask task;
      task.record_id          = record.id;
      task.missing_legs       = failed;
      task.content            = content;
      task.next_attempt_at_ms = now_ms;
      task.state              = v1::REPAIR_STATE_PENDING;
      task.last_error         = written.error;
      task.created_at_ms      = now_ms;
      task.updated_at_ms      = now_ms;
      db::ThrowIfDbError(repo_.UpsertRepairTask(*tx, task), "insert repair task");
    }

    tx->Commit();
    return true;
  });

  if (!published) {
    auto tx = repo_.Begin();
    EnqueueGarbage(*tx, record.id, written.written, written.location, now_ms, now_ms);
    tx->Commit();
    STRATA_LOG_INFO("locator claimed by another writer; staged legs discarded",
                    {StringField("source_locator", record.source_locator), StringField("record_id", record.id)});
    return std::nullopt;
  }

  if (failed != 0) {
    STRATA_LOG_WARN("record published degraded", {StringField("record_id", record.id), IntField("missing_legs", failed),
                                                  StringField("error", written.error)});
  }
  return record;
}

void ConsistencyMapper::PublishBatch(const legs::WrittenLegs& written, uint64_t now_ms) {
  if ((written.written & model::kLegVectors) == 0) return;
  util::RetryTransient(options_.retry, [&] {
    auto tx = repo_.Begin();
    db::ThrowIfDbError(repo_.CompleteBatch(*tx, written.location.vector_batch_id, now_ms), "complete batch");
    db::ThrowIfDbError(repo_.InsertVectorMappings(*tx, written.mappings), "insert mappings");
    tx->Commit();
  });
}

bool ConsistencyMapper::CompleteRepair(const std::string& record_id, const legs::WrittenLegs& repaired, uint64_t now_ms) {
  db::model::ContentRecord record;
  unsigned                 still_missing = 0;
  {
    auto tx  = repo_.Begin();
    auto rec = repo_.GetRecord(*tx, record_id);
    if (!rec) throw util::NotFound("record " + record_id);
    record = std::move(*rec);

    repaired.location.ApplyTo(record, repaired.written);
    if (repaired.written & model::kLegVectors) {
      db::ThrowIfDbError(repo_.CompleteBatch(*tx, repaired.location.vector_batch_id, now_ms), "complete batch");
      db::ThrowIfDbError(repo_.InsertVectorMappings(*tx, repaired.mappings), "insert mappings");
    }

    const auto expected  = record.version;
    record.version       = expected + 1;
    record.updated_at_ms = now_ms;
    db::ThrowIfDbError(repo_.UpdateRecord(*tx, record, expected), "update record");

    if (auto task = repo_.GetRepairTask(*tx, record_id)) {
      task->missing_legs &= ~repaired.written;
      task->updated_at_ms = now_ms;
      if (!repaired.error.empty()) task->last_error = repaired.error;
      still_missing = task->missing_legs;
      db::ThrowIfDbError(repo_.UpsertRepairTask(*tx, *task), "update repair task");
    }
    tx->Commit();
  }

  if (still_missing != 0) return false;

  const auto report = Verify(record);
  if (!report.ok) {
    STRATA_LOG_WARN("repaired record failed verification", {StringField("record_id", record_id), StringField("detail", report.detail)});
    return false;
  }

  // Stats merges may bump the version meanwhile; only a moved pointer invalidates the check.
  auto tx  = repo_.Begin();
  auto cur = repo_.GetRecord(*tx, record_id);
  if (!cur || cur->status != v1::RECORD_STATUS_DEGRADED || !(legs::Location::Of(*cur) == legs::Location::Of(record))) {
    return false;
  }

  const auto expected = cur->version;
  cur->status         = model::CheckedTransition(record_id, cur->status, v1::RECORD_STATUS_READY);
  cur->version        = expected + 1;
  cur->updated_at_ms  = now_ms;
  db::ThrowIfDbError(repo_.UpdateRecord(*tx, *cur, expected), "publish repaired record");
  db::ThrowIfDbError(repo_.DeleteRepairTask(*tx, record_id), "delete repair task");
  tx->Commit();

  STRATA_LOG_INFO("record repaired", {StringField("record_id", record_id)});
  return true;
}

VerifyReport ConsistencyMapper::Verify(const db::model::ContentRecord& record) {
  return Verify(record.id, model::LegsFor(record.strategy), legs::Location::Of(record));
}

VerifyReport ConsistencyMapper::Verify(const std::string& record_id, unsigned legs, const legs::Location& location) {
  VerifyReport report;
  auto         fail = [&](std::string why) {
    report.ok     = false;
    report.detail = std::move(why);
    return report;
  };

  if (const unsigned absent = legs & ~location.Present(); absent != 0) {
    return fail("missing leg pointer: " + std::string(model::LegName(absent & -absent)));
  }

  std::vector<std::string> point_ids;
  {
    auto tx = repo_.Begin();
    if (legs & model::kLegBlob) {
      auto blob = repo_.GetBlob(*tx, record_id, location.blob_hash);
      if (!blob) return fail("blob " + location.blob_hash + " missing");
      if (util::Sha256Hex(blob->body) != location.blob_hash) return fail("blob hash mismatch");
    }
    if (legs & model::kLegVectors) {
      auto batch = repo_.GetBatch(*tx, location.vector_batch_id);
      if (!batch) return fail("batch " + location.vector_batch_id + " missing");
      if (batch->state != v1::BATCH_STATE_COMPLETE) return fail("batch " + batch->batch_id + " not complete");
      if (batch->expected_chunks != location.chunk_count) return fail("chunk count differs from batch");
      const auto mappings = repo_.ListVectorMappings(*tx, location.vector_batch_id);
      if (mappings.size() != batch->expected_chunks) {
        return fail("batch has " + std::to_string(mappings.size()) + " of " + std::to_string(batch->expected_chunks) + " mappings");
      }
      for (const auto& m : mappings) point_ids.push_back(m.point_id);
    }
    if (legs & model::kLegTableRow) {
      auto row = repo_.GetTableRow(*tx, location.table_name, location.table_row_id);
      if (!row || row->record_id != record_id) return fail("row " + location.table_row_id + " missing in " + location.table_name);
    }
    tx->Rollback();
  }

  if ((legs & model::kLegVectors) && !legs_.PointsPresent(location.vector_collection, point_ids)) {
    return fail("vector points missing for batch " + location.vector_batch_id);
  }
  return report;
}

MigrationOutcome ConsistencyMapper::Migrate(const std::string& record_id, v1::Strategy target, uint32_t policy_version,
                                            const util::CancelToken& cancel, uint64_t now_ms) {
  db::model::ContentRecord record;
  {
    auto tx  = repo_.Begin();
    auto rec = repo_.GetRecord(*tx, record_id);
    if (!rec) throw util::NotFound("record " + record_id);
    record = std::move(*rec);

    if (record.status != v1::RECORD_STATUS_READY) {
      throw util::InvalidState("record " + record_id + " is " + std::string(model::ToString(record.status)));
    }
    if (record.strategy == target) {
      // Same placement under a newer policy: only the version stamp moves.
      if (policy_version > record.policy_version) {
        const auto expected   = record.version;
        record.policy_version = policy_version;
        record.version        = expected + 1;
        record.updated_at_ms  = now_ms;
        db::ThrowIfDbError(repo_.UpdateRecord(*tx, record, expected), "restamp policy version");
        tx->Commit();
      }
      return MigrationOutcome::kUnchanged;
    }
    if (model::LegsFor(record.strategy) == 0) {
      throw util::InvalidState("record " + record_id + " is metadata only; nothing to migrate");
    }

    const auto expected  = record.version;
    record.status        = model::CheckedTransition(record_id, record.status, v1::RECORD_STATUS_MIGRATING);
    record.version       = expected + 1;
    record.updated_at_ms = now_ms;
    db::ThrowIfDbError(repo_.UpdateRecord(*tx, record, expected), "mark migrating");
    tx->Commit();
  }

  const auto     old_location = legs::Location::Of(record);
  const unsigned old_legs     = model::LegsFor(record.strategy);
  const unsigned new_legs     = model::LegsFor(target);

  legs::WrittenLegs written;
  // Identical blobs are shared between old and new location; they are
  // neither discarded on abort nor collected after the swap.
  auto new_only = [&] {
    unsigned mask = written.written;
    if (old_location.blob_hash == written.location.blob_hash) mask &= ~model::kLegBlob;
    return mask;
  };

  try {
    const auto content = legs_.ReadContent(record.id, old_location);
    if (!content) throw util::InvalidState("content of " + record_id + " is unreadable");

    legs::LegContext ctx;
    ctx.record_id      = record.id;
    ctx.content        = *content;
    ctx.content_hash   = record.content_hash;
    ctx.title          = record.title;
    ctx.domain         = record.domain;
    ctx.content_type   = record.content_type;
    ctx.now_ms         = now_ms;
    ctx.ingested_at_ms = record.created_at_ms;

    written = legs_.Write(new_legs, ctx);
    if (written.Failed() != 0) throw util::TransientStoreError("migration write failed: " + written.error);
    PublishBatch(written, now_ms);

    if (cancel.IsCancelled()) {
      Discard(record.id, new_only(), written.location, now_ms);
      RestoreReady(record.id, now_ms);
      STRATA_LOG_INFO("migration cancelled", {StringField("record_id", record.id)});
      return MigrationOutcome::kCancelled;
    }

    const auto report = Verify(record.id, new_legs, written.location);
    if (!report.ok) {
      RecordIncident(record.id, "consistency_violation", report.detail, now_ms);
      throw util::ConsistencyViolation("migration of " + record_id + " failed verification: " + report.detail);
    }

    auto tx  = repo_.Begin();
    auto cur = repo_.GetRecord(*tx, record.id);
    if (!cur || cur->status != v1::RECORD_STATUS_MIGRATING || !(legs::Location::Of(*cur) == old_location)) {
      throw util::InvalidState("record " + record_id + " changed during migration");
    }
    const auto expected = cur->version;

    unsigned garbage = old_legs;
    if (old_location.blob_hash == written.location.blob_hash) garbage &= ~model::kLegBlob;

    written.location.ApplyTo(*cur, model::kLegBlob | model::kLegVectors | model::kLegTableRow);
    cur->reasoning.push_back("migrated from " + std::string(model::ToString(cur->strategy)) + " to " +
                             std::string(model::ToString(target)));
    cur->strategy       = target;
    cur->policy_version = policy_version;
    cur->status         = model::CheckedTransition(record_id, cur->status, v1::RECORD_STATUS_READY);
    cur->version        = expected + 1;
    cur->updated_at_ms  = now_ms;
    db::ThrowIfDbError(repo_.UpdateRecord(*tx, *cur, expected), "swap pointer");
    EnqueueGarbage(*tx, record.id, garbage, old_location, now_ms + options_.gc_grace_ms, now_ms);
    tx->Commit();
  } catch (const std::exception& e) {
    Discard(record.id, new_only(), written.location, now_ms);
    RestoreReady(record.id, now_ms);
    STRATA_LOG_WARN("migration aborted", {StringField("record_id", record.id), StringField("error", e.what())});
    throw;
  }

  STRATA_LOG_INFO("record migrated", {StringField("record_id", record.id), StringField("from", model::ToString(record.strategy)),
                                      StringField("to", model::ToString(target))});
  return MigrationOutcome::kSucceeded;
}

void ConsistencyMapper::EnqueueGarbage(db::Transaction& tx, const std::string& record_id, unsigned legs,
                                       const legs::Location& location, uint64_t eligible_at_ms, uint64_t now_ms) {
  for (unsigned leg : kAllLegs) {
    if ((legs & leg) == 0) continue;
    auto [ref, collection] = LegRef(leg, location);
    if (ref.empty()) continue;

    db::model::GarbageEntry entry;
    entry.id             = util::NewId();
    entry.record_id      = record_id;
    entry.leg            = leg;
    entry.ref            = std::move(ref);
    entry.collection     = std::move(collection);
    entry.eligible_at_ms = eligible_at_ms;
    entry.created_at_ms  = now_ms;
    db::ThrowIfDbError(repo_.InsertGarbage(tx, entry), "enqueue garbage");
  }
}

void ConsistencyMapper::Discard(const std::string& record_id, unsigned legs, const legs::Location& location, uint64_t now_ms) {
  for (unsigned leg : kAllLegs) {
    if ((legs & leg) == 0) continue;
    const auto [ref, collection] = LegRef(leg, location);
    if (ref.empty()) continue;
    try {
      legs_.DeleteLeg(record_id, leg, ref, collection);
    } catch (const std::exception& e) {
      STRATA_LOG_WARN("discard deferred to garbage collection",
                      {StringField("record_id", record_id), StringField("leg", model::LegName(leg)), StringField("error", e.what())});
      auto tx = repo_.Begin();
      EnqueueGarbage(*tx, record_id, leg, location, now_ms, now_ms);
      tx->Commit();
    }
  }
}

void ConsistencyMapper::RestoreReady(const std::string& record_id, uint64_t now_ms) {
  try {
    auto tx  = repo_.Begin();
    auto cur = repo_.GetRecord(*tx, record_id);
    if (!cur || cur->status != v1::RECORD_STATUS_MIGRATING) return;
    const auto expected = cur->version;
    cur->status         = model::CheckedTransition(record_id, cur->status, v1::RECORD_STATUS_READY);
    cur->version        = expected + 1;
    cur->updated_at_ms  = now_ms;
    db::ThrowIfDbError(repo_.UpdateRecord(*tx, *cur, expected), "restore ready");
    tx->Commit();
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR("record left migrating", {StringField("record_id", record_id), StringField("error", e.what())});
  }
}

void ConsistencyMapper::RecordIncident(const std::string& record_id, const std::string& kind, const std::string& detail,
                                       uint64_t now_ms) {
  db::model::Incident incident;
  incident.id            = util::NewId();
  incident.record_id     = record_id;
  incident.kind          = kind;
  incident.detail        = detail;
  incident.created_at_ms = now_ms;

  auto tx = repo_.Begin();
  db::ThrowIfDbError(repo_.InsertIncident(*tx, incident), "insert incident");
  tx->Commit();

  STRATA_LOG_ERROR("incident recorded", {StringField("record_id", record_id), StringField("kind", kind), StringField("detail", detail)});
}

uint64_t ConsistencyMapper::CollectGarbage(uint64_t now_ms) {
  std::vector<db::model::GarbageEntry> due;
  {
    auto tx = repo_.Begin();
    due     = repo_.ListGarbage(*tx, now_ms);
    tx->Rollback();
  }

  uint64_t removed = 0;
  for (const auto& entry : due) {
    try {
      bool live = false;
      {
        auto tx  = repo_.Begin();
        auto rec = repo_.GetRecord(*tx, entry.record_id);
        live     = rec && IsLive(*rec, entry.leg, entry.ref);
        tx->Rollback();
      }
      if (!live) legs_.DeleteLeg(entry.record_id, entry.leg, entry.ref, entry.collection);

      auto tx = repo_.Begin();
      db::ThrowIfDbError(repo_.DeleteGarbage(*tx, entry.id), "delete garbage entry");
      tx->Commit();
      ++removed;
    } catch (const std::exception& e) {
      STRATA_LOG_WARN("garbage entry retained", {StringField("id", entry.id), StringField("error", e.what())});
    }
  }
  if (removed > 0) {
    STRATA_LOG_INFO("garbage collected", {IntField("entries", static_cast<int64_t>(removed))});
  }
  return removed;
}

std::optional<db::model::ContentRecord> ConsistencyMapper::ResolveReadable(const std::string& record_id) {
  auto tx  = repo_.Begin();
  auto rec = repo_.GetRecord(*tx, record_id);
  tx->Rollback();
  if (!rec || !model::IsReadable(rec->status)) return std::nullopt;
  return rec;
}

AnalysisContent ConsistencyMapper::ReadForAnalysis(const std::string& record_id) {
  AnalysisContent out;
  std::string     pending_content;
  {
    auto tx  = repo_.Begin();
    auto rec = repo_.GetRecord(*tx, record_id);
    if (!rec) throw util::NotFound("record " + record_id);
    out.record = std::move(*rec);
    for (const auto& a : repo_.ListAnnotations(*tx, record_id)) out.annotations[a.agent] = a.json;
    if (auto task = repo_.GetRepairTask(*tx, record_id)) pending_content = task->content;
    tx->Rollback();
  }

  out.content = legs_.ReadContent(record_id, legs::Location::Of(out.record));
  if (!out.content && !pending_content.empty()) out.content = std::move(pending_content);
  return out;
}

} // namespace strata::consistency
