#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/legs/leg_store.hpp"
#include "internal/util/cancel.hpp"
#include "internal/util/retry.hpp"
#include "strata/engine/v1.hpp"

namespace strata::consistency {

struct ConsistencyOptions {
  uint64_t          gc_grace_ms = 10 * 60 * 1000;
  util::RetryPolicy retry;
};

struct VerifyReport {
  bool        ok = true;
  std::string detail;
};

enum class MigrationOutcome {
  kSucceeded,
  kUnchanged,
  kCancelled,
};

struct AnalysisContent {
  db::model::ContentRecord           record;
  std::optional<std::string>         content;
  std::map<std::string, std::string> annotations;
};

/*
  Sole writer of record location pointers.

  Invariant: the pointer of a READY record refers to fully written,
  readable legs. Pointers move only in a transaction that also commits
  the legs' completion markers; superseded legs are queued as garbage
  and deleted after gc_grace, never in the swap itself.
*/
class ConsistencyMapper {
 public:
  ConsistencyMapper(db::Repository& repo, legs::LegStore& legs, ConsistencyOptions options);

  /*
    Inserts the record with the legs that were written. Failed legs put
    the record in DEGRADED with a repair task carrying the content.
    Returns nullopt when another writer already owns the locator; the
    given legs are then queued as garbage.
  */
  std::optional<db::model::ContentRecord> PublishIngest(db::model::ContentRecord record, const legs::WrittenLegs& written,
                                                        const std::string& content, uint64_t now_ms);

  // Stores repaired pointers; true when the record was verified and set READY.
  bool CompleteRepair(const std::string& record_id, const legs::WrittenLegs& repaired, uint64_t now_ms);

  VerifyReport Verify(const db::model::ContentRecord& record);
  VerifyReport Verify(const std::string& record_id, unsigned legs, const legs::Location& location);

  /*
    Moves a READY record to target. Throws InvalidState when the record
    is not READY or holds no content, ConsistencyViolation when the new
    location fails read-back. The original pointer stays authoritative
    until the swap commits.
  */
  MigrationOutcome Migrate(const std::string& record_id, strata::engine::v1::Strategy target, uint32_t policy_version,
                           const util::CancelToken& cancel, uint64_t now_ms);

  // Deletes legs of garbage entries eligible at now_ms. Returns entries removed.
  uint64_t CollectGarbage(uint64_t now_ms);

  // The record when its pointer is resolvable (READY, DEGRADED, MIGRATING).
  std::optional<db::model::ContentRecord> ResolveReadable(const std::string& record_id);

  // Record, body and annotations for analysis agents. NotFound when missing.
  AnalysisContent ReadForAnalysis(const std::string& record_id);

 private:
  void EnqueueGarbage(db::Transaction& tx, const std::string& record_id, unsigned legs, const legs::Location& location,
                      uint64_t eligible_at_ms, uint64_t now_ms);
  void Discard(const std::string& record_id, unsigned legs, const legs::Location& location, uint64_t now_ms);
  void PublishBatch(const legs::WrittenLegs& written, uint64_t now_ms);
  void RestoreReady(const std::string& record_id, uint64_t now_ms);
  void RecordIncident(const std::string& record_id, const std::string& kind, const std::string& detail, uint64_t now_ms);

  db::Repository&    repo_;
  legs::LegStore&    legs_;
  ConsistencyOptions options_;
};

} // namespace strata::consistency
