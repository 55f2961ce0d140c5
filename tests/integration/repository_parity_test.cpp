#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/model/strategy.hpp"
#include "internal/schema/schema_builder.hpp"

#if STRATA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if STRATA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

namespace v1 = strata::engine::v1;

using strata::db::ErrorCode;
using strata::db::Repository;
using strata::db::memory::MemoryRepository;
using strata::db::model::Annotation;
using strata::db::model::BlobRecord;
using strata::db::model::ContentRecord;
using strata::db::model::GarbageEntry;
using strata::db::model::Incident;
using strata::db::model::PerformanceSample;
using strata::db::model::RecommendationRecord;
using strata::db::model::RecordFilter;
using strata::db::model::RepairTask;
using strata::db::model::StagedBatch;
using strata::db::model::TableRow;
using strata::db::model::VectorMapping;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  strata::db::sql::Dialect                          dialect = strata::db::sql::Dialect::kSqlite;
};

// Ids and search terms unique per run so a shared Postgres database can be reused.
struct RunKeys {
  std::string prefix;
  uint64_t    base_ms = 0;

  std::string Id(const std::string& name) const {
    return prefix + "-" + name;
  }
};

ContentRecord MakeRecord(const RunKeys& keys, const std::string& name, const std::string& domain, const std::string& preview) {
  ContentRecord r;
  r.id                  = keys.Id(name);
  r.source_locator      = "https://example.com/" + keys.prefix + "/" + name;
  r.title               = name;
  r.author              = "A. Writer";
  r.domain              = domain;
  r.content_type        = "small_document";
  r.declared_size       = 4096;
  r.text_size           = 4096;
  r.content_hash        = "hash-" + name;
  r.semantic_complexity = 0.4;
  r.topic_coherence     = 0.6;
  r.information_density = 0.5;
  r.query_potential     = 0.7;
  r.strategy            = v1::STRATEGY_FULL_STORE;
  r.policy_version      = 1;
  r.confidence          = 0.95;
  r.reasoning           = {"size below small threshold", "full store"};
  r.status              = v1::RECORD_STATUS_READY;
  r.blob_hash           = "hash-" + name;
  r.preview             = preview;
  r.metadata_json       = R"({"source":"parity"})";
  r.tags                = {"parity", domain};
  r.created_at_ms       = keys.base_ms;
  r.updated_at_ms       = keys.base_ms;
  return r;
}

void VerifyRecordLifecycle(Repository& repo, const RunKeys& keys) {
  const auto record = MakeRecord(keys, "life", "science", "lifecycle preview");
  {
    auto       tx  = repo.Begin();
    const auto res = repo.InsertRecord(*tx, record);
    assert(res);
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto loaded = repo.GetRecord(*tx, record.id);
  assert(loaded.has_value());
  assert(loaded->source_locator == record.source_locator);
  assert(loaded->strategy == v1::STRATEGY_FULL_STORE);
  assert(loaded->status == v1::RECORD_STATUS_READY);
  assert(loaded->reasoning == record.reasoning);
  assert(loaded->tags == record.tags);
  assert(loaded->query_potential == 0.7);
  assert(loaded->version == 1);

  auto by_locator = repo.GetRecordByLocator(*tx, record.source_locator);
  assert(by_locator.has_value() && by_locator->id == record.id);

  // a second row for the same locator is refused
  auto duplicate           = MakeRecord(keys, "life-dup", "science", "");
  duplicate.source_locator = record.source_locator;
  const auto dup           = repo.InsertRecord(*tx, duplicate);
  assert(!dup && dup.code == ErrorCode::AlreadyExists);
  tx->Rollback();

  // compare-and-swap on version
  auto stale = *loaded;
  {
    auto tx2         = repo.Begin();
    auto next        = *loaded;
    next.status      = v1::RECORD_STATUS_DEGRADED;
    next.chunk_count = 4;
    next.version     = 2;
    const auto res   = repo.UpdateRecord(*tx2, next, 1);
    assert(res);
    tx2->Commit();
  }
  {
    auto tx3       = repo.Begin();
    stale.version  = 2;
    const auto res = repo.UpdateRecord(*tx3, stale, 1);
    assert(!res && res.code == ErrorCode::Conflict);

    const auto stats = repo.MergeAccessStats(*tx3, record.id, 3, keys.base_ms + 50, 0.25);
    assert(stats);
    tx3->Commit();
  }

  auto tx4   = repo.Begin();
  auto after = repo.GetRecord(*tx4, record.id);
  assert(after->status == v1::RECORD_STATUS_DEGRADED);
  assert(after->chunk_count == 4);
  // access stats never bump the version
  assert(after->version == 2);
  assert(after->query_count == 3);
  assert(after->last_queried_at_ms == keys.base_ms + 50);
  tx4->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const RunKeys& keys) {
  const auto record = MakeRecord(keys, "rolled-back", "science", "");
  {
    auto tx = repo.Begin();
    assert(repo.InsertRecord(*tx, record));
    tx->Rollback();
  }
  auto tx = repo.Begin();
  assert(!repo.GetRecord(*tx, record.id).has_value());
  assert(!repo.GetRecordByLocator(*tx, record.source_locator).has_value());
  tx->Rollback();
}

void VerifyFilteredScansAndSearch(Repository& repo, const RunKeys& keys) {
  const std::string term = "marker" + std::to_string(keys.base_ms);
  const auto        a    = MakeRecord(keys, "search-a", "physics", term + " quantum entanglement across distant particles");
  const auto        b    = MakeRecord(keys, "search-b", "physics", "entanglement only, the other word is absent " + term);
  auto              c    = MakeRecord(keys, "search-c", "poetry", term + " quantum verses about particles");
  c.policy_version       = 0;
  c.needs_review         = true;
  {
    auto tx = repo.Begin();
    assert(repo.InsertRecord(*tx, a));
    assert(repo.InsertRecord(*tx, b));
    assert(repo.InsertRecord(*tx, c));
    tx->Commit();
  }

  auto tx = repo.Begin();

  RecordFilter none;
  auto         hits = repo.SearchText(*tx, term + " quantum", none, 10);
  std::vector<std::string> ids;
  for (const auto& h : hits) ids.push_back(h.record_id);
  assert(ids.size() == 2);
  assert(std::find(ids.begin(), ids.end(), a.id) != ids.end());
  assert(std::find(ids.begin(), ids.end(), c.id) != ids.end());
  assert(hits[0].rank >= hits[1].rank);

  RecordFilter physics;
  physics.domain = "physics";
  hits           = repo.SearchText(*tx, term + " quantum", physics, 10);
  assert(hits.size() == 1 && hits[0].record_id == a.id);

  hits = repo.SearchText(*tx, term, physics, 1);
  assert(hits.size() == 1);

  RecordFilter by_domain;
  by_domain.domain           = "poetry";
  by_domain.created_after_ms = keys.base_ms - 1;
  auto poetry                = repo.ListRecords(*tx, by_domain);
  assert(std::any_of(poetry.begin(), poetry.end(), [&](const auto& r) { return r.id == c.id; }));
  for (const auto& r : poetry) assert(r.domain == "poetry");

  RecordFilter stale;
  stale.policy_version_below = 1;
  stale.needs_review_only    = true;
  stale.created_after_ms     = keys.base_ms - 1;
  stale.created_before_ms    = keys.base_ms + 1;
  assert(repo.CountRecords(*tx, stale) >= 1);
  for (const auto& r : repo.ListRecords(*tx, stale)) {
    assert(r.policy_version < 1 && r.needs_review);
  }
  tx->Rollback();
}

void VerifyBlobs(Repository& repo, const RunKeys& keys) {
  const auto owner = MakeRecord(keys, "blob-owner", "science", "");
  BlobRecord blob{owner.id, "hash-blob", "the complete body", 17, "", keys.base_ms};
  BlobRecord orphan{keys.Id("gone"), "hash-orphan", "orphaned body", 13, "", 1};
  {
    auto tx = repo.Begin();
    assert(repo.InsertRecord(*tx, owner));
    assert(repo.InsertBlob(*tx, blob));
    // idempotent on (owner, hash)
    assert(repo.InsertBlob(*tx, blob));
    assert(repo.InsertBlob(*tx, orphan));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.CountBlobs(*tx, owner.id) == 1);
  auto loaded = repo.GetBlob(*tx, owner.id, "hash-blob");
  assert(loaded.has_value() && loaded->body == "the complete body" && loaded->size_bytes == 17);

  assert(repo.DeleteOrphanBlobs(*tx, 2) >= 1);
  assert(!repo.GetBlob(*tx, orphan.owner_record_id, orphan.content_hash).has_value());
  assert(repo.GetBlob(*tx, owner.id, "hash-blob").has_value());

  assert(repo.DeleteBlob(*tx, owner.id, "hash-blob"));
  assert(repo.CountBlobs(*tx, owner.id) == 0);
  tx->Commit();
}

void VerifyStagedBatches(Repository& repo, const RunKeys& keys) {
  const auto  owner    = MakeRecord(keys, "batch-owner", "science", "");
  const auto  batch_id = keys.Id("batch");
  StagedBatch batch{batch_id, owner.id, "chunks", 3, v1::BATCH_STATE_PENDING, keys.base_ms, 0};

  std::vector<VectorMapping> mappings;
  for (uint32_t seq : {2u, 0u, 1u}) {
    mappings.push_back({owner.id, batch_id, "chunks", batch_id + "-" + std::to_string(seq), 8, "hashing-v1", seq});
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertRecord(*tx, owner));
    assert(repo.InsertBatch(*tx, batch));
    assert(repo.InsertVectorMappings(*tx, mappings));
    tx->Commit();
  }

  auto tx      = repo.Begin();
  auto pending = repo.ListPendingBatches(*tx, keys.base_ms + 1);
  assert(std::any_of(pending.begin(), pending.end(), [&](const auto& b) { return b.batch_id == batch_id; }));

  auto listed = repo.ListVectorMappings(*tx, batch_id);
  assert(listed.size() == 3);
  for (uint32_t i = 0; i < 3; ++i) assert(listed[i].chunk_sequence == i);

  assert(repo.CompleteBatch(*tx, batch_id, keys.base_ms + 5));
  const auto again = repo.CompleteBatch(*tx, batch_id, keys.base_ms + 6);
  assert(!again && again.code == ErrorCode::Conflict);

  auto completed = repo.GetBatch(*tx, batch_id);
  assert(completed->state == v1::BATCH_STATE_COMPLETE);
  assert(completed->completed_at_ms == keys.base_ms + 5);
  pending = repo.ListPendingBatches(*tx, keys.base_ms + 1);
  assert(std::none_of(pending.begin(), pending.end(), [&](const auto& b) { return b.batch_id == batch_id; }));

  assert(repo.DeleteBatch(*tx, batch_id));
  assert(!repo.GetBatch(*tx, batch_id).has_value());
  assert(repo.ListVectorMappings(*tx, batch_id).empty());
  tx->Commit();
}

void VerifyDynamicTables(Repository& repo, const RunKeys& keys, strata::db::sql::Dialect dialect) {
  const strata::schema::SchemaBuilder builder(dialect, "dyn");
  auto descriptor  = builder.ForContent(keys.prefix, "book", keys.base_ms);
  descriptor.state = strata::db::model::DescriptorState::kApplied;

  TableRow row{keys.Id("row"), keys.Id("row-owner"), "A Title", "row body", 2, keys.base_ms};
  {
    auto tx = repo.Begin();
    assert(repo.ApplyTableSchema(*tx, descriptor));
    // DDL is idempotent
    assert(repo.ApplyTableSchema(*tx, descriptor));
    assert(repo.UpsertTableDescriptor(*tx, descriptor));
    assert(repo.InsertTableRow(*tx, descriptor.name, row));
    assert(repo.BumpTableUsage(*tx, descriptor.name, 1, 2));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetTableDescriptor(*tx, descriptor.name);
  assert(stored.has_value());
  assert(stored->columns.size() == descriptor.columns.size());
  assert(stored->ddl == descriptor.ddl);
  assert(stored->row_count == 1);
  assert(stored->query_count == 2);

  auto all = repo.ListTableDescriptors(*tx);
  assert(std::any_of(all.begin(), all.end(), [&](const auto& d) { return d.name == descriptor.name; }));

  auto loaded = repo.GetTableRow(*tx, descriptor.name, row.row_id);
  assert(loaded.has_value() && loaded->body == "row body" && loaded->record_id == row.record_id);
  assert(!repo.InsertTableRow(*tx, descriptor.name, row));
  tx->Rollback();

  auto tx2 = repo.Begin();
  assert(repo.DeleteTableRow(*tx2, descriptor.name, row.row_id));
  assert(!repo.GetTableRow(*tx2, descriptor.name, row.row_id).has_value());
  tx2->Commit();
}

void VerifyMaintenanceBookkeeping(Repository& repo, const RunKeys& keys) {
  const auto record_id = keys.Id("repair");

  RepairTask task;
  task.record_id          = record_id;
  task.missing_legs       = strata::model::kLegVectors;
  task.content            = "body to rewrite";
  task.attempts           = 1;
  task.next_attempt_at_ms = keys.base_ms + 100;
  task.last_error         = "vector store unavailable";
  task.created_at_ms      = keys.base_ms;
  task.updated_at_ms      = keys.base_ms;

  GarbageEntry garbage{keys.Id("garbage"), record_id, strata::model::kLegBlob, "hash-old", "", keys.base_ms + 100, keys.base_ms};

  auto has_task = [&](const std::vector<RepairTask>& tasks) {
    return std::any_of(tasks.begin(), tasks.end(), [&](const auto& t) { return t.record_id == record_id; });
  };
  auto has_garbage = [&](const std::vector<GarbageEntry>& entries) {
    return std::any_of(entries.begin(), entries.end(), [&](const auto& g) { return g.id == garbage.id; });
  };

  auto tx = repo.Begin();
  assert(repo.UpsertRepairTask(*tx, task));
  auto loaded = repo.GetRepairTask(*tx, record_id);
  assert(loaded.has_value());
  assert(loaded->missing_legs == strata::model::kLegVectors);
  assert(loaded->content == "body to rewrite");

  assert(!has_task(repo.ListRepairTasks(*tx, v1::REPAIR_STATE_PENDING, keys.base_ms + 50)));
  assert(has_task(repo.ListRepairTasks(*tx, v1::REPAIR_STATE_PENDING, keys.base_ms + 150)));

  task.state    = v1::REPAIR_STATE_FATAL;
  task.attempts = 3;
  assert(repo.UpsertRepairTask(*tx, task));
  assert(repo.GetRepairTask(*tx, record_id)->attempts == 3);
  assert(!has_task(repo.ListRepairTasks(*tx, v1::REPAIR_STATE_PENDING, 0)));
  assert(has_task(repo.ListRepairTasks(*tx, v1::REPAIR_STATE_FATAL, 0)));
  assert(has_task(repo.ListRepairTasks(*tx, v1::REPAIR_STATE_UNSPECIFIED, 0)));
  assert(repo.DeleteRepairTask(*tx, record_id));
  assert(!repo.GetRepairTask(*tx, record_id).has_value());

  assert(repo.InsertGarbage(*tx, garbage));
  assert(!has_garbage(repo.ListGarbage(*tx, keys.base_ms + 50)));
  assert(has_garbage(repo.ListGarbage(*tx, keys.base_ms + 150)));
  assert(repo.DeleteGarbage(*tx, garbage.id));
  assert(!has_garbage(repo.ListGarbage(*tx, 0)));

  // far in the future so they sort ahead of anything left by earlier runs
  const uint64_t incident_at = keys.base_ms + 10ULL * 365 * 24 * 3600 * 1000;
  assert(repo.InsertIncident(*tx, Incident{keys.Id("inc-1"), record_id, "consistency_violation", "first", incident_at}));
  assert(repo.InsertIncident(*tx, Incident{keys.Id("inc-2"), record_id, "repair_exhausted", "second", incident_at + 1}));
  auto incidents = repo.ListIncidents(*tx, 2);
  assert(incidents.size() == 2);
  assert(incidents[0].id == keys.Id("inc-2"));
  assert(incidents[1].kind == "consistency_violation");

  const auto owner = MakeRecord(keys, "annotated", "science", "");
  assert(repo.InsertRecord(*tx, owner));
  assert(repo.UpsertAnnotation(*tx, Annotation{owner.id, "tagger", R"({"v":1})", keys.base_ms}));
  assert(repo.UpsertAnnotation(*tx, Annotation{owner.id, "tagger", R"({"v":2})", keys.base_ms + 1}));
  assert(repo.UpsertAnnotation(*tx, Annotation{owner.id, "summarizer", R"({"s":"x"})", keys.base_ms}));
  auto notes = repo.ListAnnotations(*tx, owner.id);
  assert(notes.size() == 2);
  for (const auto& n : notes) {
    if (n.agent == "tagger") assert(n.json.find('2') != std::string::npos);
  }
  tx->Commit();
}

void VerifySamplesAndRecommendations(Repository& repo, const RunKeys& keys) {
  const uint64_t                 at = keys.base_ms + 20ULL * 365 * 24 * 3600 * 1000;
  std::vector<PerformanceSample> samples(2);
  samples[0].signature     = keys.Id("sig-a");
  samples[0].mode          = v1::QUERY_MODE_HYBRID;
  samples[0].domain        = "science";
  samples[0].strategy      = v1::STRATEGY_HYBRID;
  samples[0].latency_ms    = 12.5;
  samples[0].rows          = 4;
  samples[0].created_at_ms = at;
  samples[1]               = samples[0];
  samples[1].signature     = keys.Id("sig-b");
  samples[1].partial       = true;
  samples[1].created_at_ms = at + 10;

  const std::string target = keys.Id("domain");
  RecommendationRecord rec;
  rec.id                        = keys.Id("rec");
  rec.type                      = v1::RECOMMENDATION_TYPE_ADD_INDEX;
  rec.target                    = target;
  rec.description               = "add index";
  rec.estimated_improvement_pct = 35.0;
  rec.confidence                = 0.8;
  rec.created_at_ms             = keys.base_ms;
  rec.updated_at_ms             = keys.base_ms;

  auto tx = repo.Begin();
  assert(repo.InsertSamples(*tx, samples));
  auto listed = repo.ListSamples(*tx, at + 5);
  assert(std::any_of(listed.begin(), listed.end(), [&](const auto& s) { return s.signature == samples[1].signature && s.partial; }));
  assert(std::none_of(listed.begin(), listed.end(), [&](const auto& s) { return s.signature == samples[0].signature; }));
  assert(repo.DeleteSamplesBefore(*tx, at + 5));
  listed = repo.ListSamples(*tx, at);
  assert(std::none_of(listed.begin(), listed.end(), [&](const auto& s) { return s.signature == samples[0].signature; }));

  assert(repo.InsertRecommendation(*tx, rec));
  auto pending = repo.FindPendingRecommendation(*tx, v1::RECOMMENDATION_TYPE_ADD_INDEX, target);
  assert(pending.has_value() && pending->id == rec.id);
  assert(!repo.FindPendingRecommendation(*tx, v1::RECOMMENDATION_TYPE_MIGRATE_STRATEGY, target).has_value());

  rec.status        = v1::RECOMMENDATION_STATUS_APPLIED;
  rec.detail        = "index created";
  rec.updated_at_ms = keys.base_ms + 1;
  assert(repo.UpdateRecommendation(*tx, rec));
  assert(!repo.FindPendingRecommendation(*tx, v1::RECOMMENDATION_TYPE_ADD_INDEX, target).has_value());

  auto loaded = repo.GetRecommendation(*tx, rec.id);
  assert(loaded->status == v1::RECOMMENDATION_STATUS_APPLIED);
  assert(loaded->detail == "index created");
  auto applied = repo.ListRecommendations(*tx, v1::RECOMMENDATION_STATUS_APPLIED);
  assert(std::any_of(applied.begin(), applied.end(), [&](const auto& r) { return r.id == rec.id; }));

  RecommendationRecord rejected = rec;
  rejected.id            = keys.Id("rec-rejected");
  rejected.status        = v1::RECOMMENDATION_STATUS_REJECTED;
  rejected.detail        = "duplicate";
  rejected.updated_at_ms = keys.base_ms + 2;
  assert(repo.InsertRecommendation(*tx, rejected));
  assert(repo.DeleteRecommendationsBefore(*tx, v1::RECOMMENDATION_STATUS_REJECTED, keys.base_ms + 2));
  assert(repo.GetRecommendation(*tx, rejected.id).has_value());
  assert(repo.DeleteRecommendationsBefore(*tx, v1::RECOMMENDATION_STATUS_REJECTED, keys.base_ms + 3));
  assert(!repo.GetRecommendation(*tx, rejected.id).has_value());
  assert(repo.GetRecommendation(*tx, rec.id).has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const RunKeys& keys) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo   = backend.make_repository();
  const auto record = MakeRecord(keys, "durable", "science", "durable preview text");
  {
    auto tx = repo->Begin();
    assert(repo->InsertRecord(*tx, record));
    assert(repo->InsertBlob(*tx, BlobRecord{record.id, record.blob_hash, "durable body", 12, "", keys.base_ms}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetRecord(*tx, record.id);
  assert(r.has_value());
  assert(r->preview == "durable preview text");
  auto blob = repo->GetBlob(*tx, record.id, record.blob_hash);
  assert(blob.has_value() && blob->body == "durable body");
  tx->Rollback();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .dialect          = strata::db::sql::Dialect::kSqlite,
  };
}

#if STRATA_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("strata_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db   = std::make_shared<strata::db::sqlite::SqliteDB>(db_path);
    auto repo = std::make_shared<strata::db::sqlite::SqliteRepository>(std::move(db));
    repo->Bootstrap();
    return repo;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .dialect = strata::db::sql::Dialect::kSqlite,
  };
}
#endif

#if STRATA_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("STRATA_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("STRATA_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<strata::db::postgres::PgPool>(conninfo, 4);
    auto repo = std::make_shared<strata::db::postgres::PgRepository>(std::move(pool));
    repo->Bootstrap();
    return repo;
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = []() {},
      .dialect = strata::db::sql::Dialect::kPostgres,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const RunKeys keys{backend.name + std::to_string(NowMs()), NowMs()};

  {
    auto repo = backend.make_repository();

    VerifyRecordLifecycle(*repo, keys);
    VerifyRollbackBehavior(*repo, keys);
    VerifyFilteredScansAndSearch(*repo, keys);
    VerifyBlobs(*repo, keys);
    VerifyStagedBatches(*repo, keys);
    VerifyDynamicTables(*repo, keys, backend.dialect);
    VerifyMaintenanceBookkeeping(*repo, keys);
    VerifySamplesAndRecommendations(*repo, keys);
  }

  VerifyRestartDurability(backend, keys);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if STRATA_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if STRATA_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "strata_integration_repository_parity: pass\n";
  return 0;
}
