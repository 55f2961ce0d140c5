#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/blob_record.hpp"
#include "internal/db/model/content_record.hpp"
#include "internal/db/model/maintenance_records.hpp"
#include "internal/db/model/performance_sample.hpp"
#include "internal/db/model/recommendation_record.hpp"
#include "internal/db/model/table_descriptor.hpp"
#include "internal/db/model/vector_records.hpp"

namespace strata::db {

/*
  Relational store abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateRecord is a compare-and-swap on version
  - source_locator is unique across content records
  - InsertBlob is idempotent on (owner_record_id, content_hash)

  The relational store is the source of truth for:
    content records and their location pointers
    staged batch state (completion markers)
    repair / garbage / incident bookkeeping
    performance samples and recommendations

  Reads return values directly; backend failures on reads throw.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Content records
  // ---------------------------------------------------------------------

  // AlreadyExists when the id or source_locator is taken.
  virtual Result InsertRecord(Transaction&, const model::ContentRecord&) = 0;

  virtual std::optional<model::ContentRecord> GetRecord(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ContentRecord> GetRecordByLocator(Transaction&, const std::string& source_locator) = 0;

  // Ordered by id.
  virtual std::vector<model::ContentRecord> ListRecords(Transaction&, const model::RecordFilter&) = 0;

  virtual uint64_t CountRecords(Transaction&, const model::RecordFilter&) = 0;

  // Writes every column of the record when the stored version equals
  // expected_version; Conflict otherwise.
  virtual Result UpdateRecord(Transaction&, const model::ContentRecord&, uint64_t expected_version) = 0;

  // Relaxed stats merge; touches only access columns, never version.
  virtual Result MergeAccessStats(Transaction&, const std::string& id, uint64_t query_delta, uint64_t last_queried_at_ms,
                                  double access_frequency) = 0;

  // Native full-text ranking over title + preview, filters pushed down.
  virtual std::vector<model::TextHit> SearchText(Transaction&, const std::string& query, const model::RecordFilter&,
                                                 std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Full content blobs
  // ---------------------------------------------------------------------

  virtual Result InsertBlob(Transaction&, const model::BlobRecord&) = 0;

  virtual std::optional<model::BlobRecord> GetBlob(Transaction&, const std::string& owner_record_id, const std::string& content_hash) = 0;

  virtual uint64_t CountBlobs(Transaction&, const std::string& owner_record_id) = 0;

  virtual Result DeleteBlob(Transaction&, const std::string& owner_record_id, const std::string& content_hash) = 0;

  // Deletes blobs whose owner record does not exist and that were created
  // before cutoff_ms. Returns the number removed.
  virtual uint64_t DeleteOrphanBlobs(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Staged vector batches + mappings
  // ---------------------------------------------------------------------

  virtual Result InsertBatch(Transaction&, const model::StagedBatch&) = 0;

  virtual std::optional<model::StagedBatch> GetBatch(Transaction&, const std::string& batch_id) = 0;

  // PENDING -> COMPLETE. Conflict if the batch is not pending.
  virtual Result CompleteBatch(Transaction&, const std::string& batch_id, uint64_t completed_at_ms) = 0;

  virtual std::vector<model::StagedBatch> ListPendingBatches(Transaction&, uint64_t created_before_ms) = 0;

  // Removes the batch and its mappings.
  virtual Result DeleteBatch(Transaction&, const std::string& batch_id) = 0;

  virtual Result InsertVectorMappings(Transaction&, const std::vector<model::VectorMapping>&) = 0;

  // Ordered by chunk_sequence.
  virtual std::vector<model::VectorMapping> ListVectorMappings(Transaction&, const std::string& batch_id) = 0;

  // ---------------------------------------------------------------------
  // Dynamic tables
  // ---------------------------------------------------------------------

  virtual Result UpsertTableDescriptor(Transaction&, const model::TableDescriptor&) = 0;

  virtual std::optional<model::TableDescriptor> GetTableDescriptor(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::TableDescriptor> ListTableDescriptors(Transaction&) = 0;

  // Executes the descriptor's DDL statements.
  virtual Result ApplyTableSchema(Transaction&, const model::TableDescriptor&) = 0;

  virtual Result InsertTableRow(Transaction&, const std::string& table, const model::TableRow&) = 0;

  virtual std::optional<model::TableRow> GetTableRow(Transaction&, const std::string& table, const std::string& row_id) = 0;

  virtual Result DeleteTableRow(Transaction&, const std::string& table, const std::string& row_id) = 0;

  virtual Result BumpTableUsage(Transaction&, const std::string& name, int64_t rows_delta, uint64_t queries_delta) = 0;

  // ---------------------------------------------------------------------
  // Repair, garbage, incidents, annotations
  // ---------------------------------------------------------------------

  virtual Result UpsertRepairTask(Transaction&, const model::RepairTask&) = 0;

  virtual std::optional<model::RepairTask> GetRepairTask(Transaction&, const std::string& record_id) = 0;

  // state UNSPECIFIED matches any state; due_before_ms 0 disables the due check.
  virtual std::vector<model::RepairTask> ListRepairTasks(Transaction&, strata::engine::v1::RepairState state, uint64_t due_before_ms) = 0;

  virtual Result DeleteRepairTask(Transaction&, const std::string& record_id) = 0;

  virtual Result InsertGarbage(Transaction&, const model::GarbageEntry&) = 0;

  // eligible_before_ms 0 lists every entry.
  virtual std::vector<model::GarbageEntry> ListGarbage(Transaction&, uint64_t eligible_before_ms) = 0;

  virtual Result DeleteGarbage(Transaction&, const std::string& id) = 0;

  virtual Result InsertIncident(Transaction&, const model::Incident&) = 0;

  // Newest first.
  virtual std::vector<model::Incident> ListIncidents(Transaction&, std::size_t limit) = 0;

  virtual Result UpsertAnnotation(Transaction&, const model::Annotation&) = 0;

  virtual std::vector<model::Annotation> ListAnnotations(Transaction&, const std::string& record_id) = 0;

  // ---------------------------------------------------------------------
  // Performance samples
  // ---------------------------------------------------------------------

  virtual Result InsertSamples(Transaction&, const std::vector<model::PerformanceSample>&) = 0;

  virtual std::vector<model::PerformanceSample> ListSamples(Transaction&, uint64_t since_ms) = 0;

  virtual Result DeleteSamplesBefore(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Recommendations
  // ---------------------------------------------------------------------

  virtual Result InsertRecommendation(Transaction&, const model::RecommendationRecord&) = 0;

  virtual std::optional<model::RecommendationRecord> GetRecommendation(Transaction&, const std::string& id) = 0;

  // status UNSPECIFIED lists all; ordered by created_at_ms then id.
  virtual std::vector<model::RecommendationRecord> ListRecommendations(Transaction&, strata::engine::v1::RecommendationStatus status) = 0;

  virtual Result UpdateRecommendation(Transaction&, const model::RecommendationRecord&) = 0;

  // Removes rows in `status` last updated before cutoff_ms.
  virtual Result DeleteRecommendationsBefore(Transaction&, strata::engine::v1::RecommendationStatus status, uint64_t cutoff_ms) = 0;

  virtual std::optional<model::RecommendationRecord> FindPendingRecommendation(Transaction&, strata::engine::v1::RecommendationType type,
                                                                               const std::string& target) = 0;
};

} // namespace strata::db
