#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace strata::db::sqlite {

/*
  SQLite repository.

  Full-text search runs on the FTS5 index content_search (bm25 ranking).
  Dynamic tables are real tables created from descriptor DDL.
*/
class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the core schema (idempotent).
  void Bootstrap();

  std::unique_ptr<Transaction> Begin() override;

  Result                              InsertRecord(Transaction&, const model::ContentRecord&) override;
  std::optional<model::ContentRecord> GetRecord(Transaction&, const std::string& id) override;
  std::optional<model::ContentRecord> GetRecordByLocator(Transaction&, const std::string& source_locator) override;
  std::vector<model::ContentRecord>   ListRecords(Transaction&, const model::RecordFilter&) override;
  uint64_t                            CountRecords(Transaction&, const model::RecordFilter&) override;
  Result                              UpdateRecord(Transaction&, const model::ContentRecord&, uint64_t expected_version) override;
  Result MergeAccessStats(Transaction&, const std::string& id, uint64_t query_delta, uint64_t last_queried_at_ms, double access_frequency) override;
  std::vector<model::TextHit> SearchText(Transaction&, const std::string& query, const model::RecordFilter&, std::size_t limit) override;

  Result                           InsertBlob(Transaction&, const model::BlobRecord&) override;
  std::optional<model::BlobRecord> GetBlob(Transaction&, const std::string& owner_record_id, const std::string& content_hash) override;
  uint64_t                         CountBlobs(Transaction&, const std::string& owner_record_id) override;
  Result                           DeleteBlob(Transaction&, const std::string& owner_record_id, const std::string& content_hash) override;
  uint64_t                         DeleteOrphanBlobs(Transaction&, uint64_t cutoff_ms) override;

  Result                             InsertBatch(Transaction&, const model::StagedBatch&) override;
  std::optional<model::StagedBatch>  GetBatch(Transaction&, const std::string& batch_id) override;
  Result                             CompleteBatch(Transaction&, const std::string& batch_id, uint64_t completed_at_ms) override;
  std::vector<model::StagedBatch>    ListPendingBatches(Transaction&, uint64_t created_before_ms) override;
  Result                             DeleteBatch(Transaction&, const std::string& batch_id) override;
  Result                             InsertVectorMappings(Transaction&, const std::vector<model::VectorMapping>&) override;
  std::vector<model::VectorMapping>  ListVectorMappings(Transaction&, const std::string& batch_id) override;

  Result                                UpsertTableDescriptor(Transaction&, const model::TableDescriptor&) override;
  std::optional<model::TableDescriptor> GetTableDescriptor(Transaction&, const std::string& name) override;
  std::vector<model::TableDescriptor>   ListTableDescriptors(Transaction&) override;
  Result                                ApplyTableSchema(Transaction&, const model::TableDescriptor&) override;
  Result                                InsertTableRow(Transaction&, const std::string& table, const model::TableRow&) override;
  std::optional<model::TableRow>        GetTableRow(Transaction&, const std::string& table, const std::string& row_id) override;
  Result                                DeleteTableRow(Transaction&, const std::string& table, const std::string& row_id) override;
  Result BumpTableUsage(Transaction&, const std::string& name, int64_t rows_delta, uint64_t queries_delta) override;

  Result                           UpsertRepairTask(Transaction&, const model::RepairTask&) override;
  std::optional<model::RepairTask> GetRepairTask(Transaction&, const std::string& record_id) override;
  std::vector<model::RepairTask>   ListRepairTasks(Transaction&, strata::engine::v1::RepairState state, uint64_t due_before_ms) override;
  Result                           DeleteRepairTask(Transaction&, const std::string& record_id) override;
  Result                           InsertGarbage(Transaction&, const model::GarbageEntry&) override;
  std::vector<model::GarbageEntry> ListGarbage(Transaction&, uint64_t eligible_before_ms) override;
  Result                           DeleteGarbage(Transaction&, const std::string& id) override;
  Result                           InsertIncident(Transaction&, const model::Incident&) override;
  std::vector<model::Incident>     ListIncidents(Transaction&, std::size_t limit) override;
  Result                           UpsertAnnotation(Transaction&, const model::Annotation&) override;
  std::vector<model::Annotation>   ListAnnotations(Transaction&, const std::string& record_id) override;

  Result                                  InsertSamples(Transaction&, const std::vector<model::PerformanceSample>&) override;
  std::vector<model::PerformanceSample>   ListSamples(Transaction&, uint64_t since_ms) override;
  Result                                  DeleteSamplesBefore(Transaction&, uint64_t cutoff_ms) override;

  Result                                     InsertRecommendation(Transaction&, const model::RecommendationRecord&) override;
  std::optional<model::RecommendationRecord> GetRecommendation(Transaction&, const std::string& id) override;
  std::vector<model::RecommendationRecord> ListRecommendations(Transaction&, strata::engine::v1::RecommendationStatus status) override;
  Result                                   UpdateRecommendation(Transaction&, const model::RecommendationRecord&) override;
  Result                                   DeleteRecommendationsBefore(Transaction&, strata::engine::v1::RecommendationStatus status, uint64_t cutoff_ms) override;
  std::optional<model::RecommendationRecord> FindPendingRecommendation(Transaction&, strata::engine::v1::RecommendationType type,
                                                                       const std::string& target) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace strata::db::sqlite
