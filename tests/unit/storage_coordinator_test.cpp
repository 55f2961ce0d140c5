#include "internal/coordinator/storage_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "support/test_support.hpp"

namespace {

namespace v1 = strata::engine::v1;

using strata::testing::Harness;
using strata::testing::MakeRequest;

constexpr uint64_t kKiB  = 1024;
constexpr uint64_t kMiB  = 1024 * kKiB;
constexpr uint64_t kNow  = 1'700'000'000'000ULL;
constexpr uint64_t kHour = 3600ULL * 1000;

void TestTechArticleIsFullStored() {
  Harness h;
  const auto text = strata::testing::TechArticle(10 * 1024);

  const auto resp = h.coordinator.Ingest(MakeRequest("https://example.com/tech/article", text, "technology"), kNow);
  assert(resp.strategy() == v1::STRATEGY_FULL_STORE);
  assert(resp.status() == v1::RECORD_STATUS_READY);
  assert(resp.confidence() >= 0.7 && resp.confidence() <= 0.99);
  assert(!resp.rescrape());

  auto tx  = h.repo->Begin();
  auto rec = h.repo->GetRecord(*tx, resp.record_id());
  assert(rec);
  assert(h.repo->CountBlobs(*tx, rec->id) == 1);
  assert(rec->vector_batch_id.empty());
  assert(rec->chunk_count == 0);
  auto blob = h.repo->GetBlob(*tx, rec->id, rec->blob_hash);
  assert(blob && blob->body == text);
  tx->Rollback();
}

void TestLargeLiteratureBookIsVectorStored() {
  Harness h;
  const auto text = strata::testing::RepetitiveText(60);
  assert(text.size() > 1000);

  const auto resp =
      h.coordinator.Ingest(MakeRequest("https://example.com/library/novel", text, "literature", 60 * kMiB), kNow);
  assert(resp.strategy() == v1::STRATEGY_VECTOR_STORE);
  assert(resp.status() == v1::RECORD_STATUS_READY);

  auto tx  = h.repo->Begin();
  auto rec = h.repo->GetRecord(*tx, resp.record_id());
  assert(rec);
  assert(rec->chunk_count > 1);
  assert(rec->blob_hash.empty());
  assert(h.repo->CountBlobs(*tx, rec->id) == 0);

  auto batch = h.repo->GetBatch(*tx, rec->vector_batch_id);
  assert(batch);
  assert(batch->state == v1::BATCH_STATE_COMPLETE);
  assert(batch->expected_chunks == rec->chunk_count);
  assert(h.repo->ListVectorMappings(*tx, rec->vector_batch_id).size() == rec->chunk_count);
  tx->Rollback();

  assert(h.vectors->Count("test_chunks") == rec->chunk_count);
}

void TestDenseContentLandsInSpecializedTable() {
  Harness h;
  const auto resp = h.coordinator.Ingest(
      MakeRequest("https://example.com/archive/ledger", strata::testing::DistinctWords(300), "history", 100 * kKiB), kNow);
  assert(resp.strategy() == v1::STRATEGY_SPECIALIZED_TABLE);
  assert(resp.status() == v1::RECORD_STATUS_READY);

  auto tx  = h.repo->Begin();
  auto rec = h.repo->GetRecord(*tx, resp.record_id());
  assert(rec && !rec->table_name.empty());
  auto row = h.repo->GetTableRow(*tx, rec->table_name, rec->table_row_id);
  assert(row && row->record_id == rec->id);
  auto descriptor = h.repo->GetTableDescriptor(*tx, rec->table_name);
  assert(descriptor && descriptor->row_count == 1);
  tx->Rollback();
}

void TestMetadataOnlyWritesNoLegs() {
  Harness h;
  const auto resp = h.coordinator.Ingest(
      MakeRequest("https://example.com/misc/notes", strata::testing::RepetitiveText(20), "general", 2 * kMiB), kNow);
  assert(resp.strategy() == v1::STRATEGY_METADATA_ONLY);
  assert(resp.status() == v1::RECORD_STATUS_READY);

  const auto rec = h.Get(resp.record_id());
  assert(rec);
  assert(rec->blob_hash.empty() && rec->vector_batch_id.empty() && rec->table_row_id.empty());
  assert(!rec->preview.empty());
}

void TestHybridWritesBlobAndVectors() {
  Harness h;
  const auto resp = h.coordinator.Ingest(
      MakeRequest("https://example.com/journal/survey", strata::testing::RepetitiveText(30), "science", 2 * kMiB), kNow);
  assert(resp.strategy() == v1::STRATEGY_HYBRID);
  assert(resp.status() == v1::RECORD_STATUS_READY);

  const auto rec = h.Get(resp.record_id());
  assert(rec && !rec->blob_hash.empty() && !rec->vector_batch_id.empty());
  assert(h.mapper.Verify(*rec).ok);
}

void TestReingestIsIdempotent() {
  Harness h;
  const auto req = MakeRequest("https://example.com/tech/again", strata::testing::TechArticle(4096), "technology");

  const auto first  = h.coordinator.Ingest(req, kNow);
  const auto second = h.coordinator.Ingest(req, kNow + 1000);
  assert(first.record_id() == second.record_id());
  assert(!first.rescrape());
  assert(second.rescrape());

  auto changed = req;
  changed.set_raw_text("completely different body for the same page");
  const auto third = h.coordinator.Ingest(changed, kNow + 2000);
  assert(third.record_id() == first.record_id());
  assert(third.rescrape());

  auto tx = h.repo->Begin();
  assert(h.repo->CountRecords(*tx, {}) == 1);
  auto rec = h.repo->GetRecord(*tx, first.record_id());
  assert(rec->scrape_count == 3);
  assert(rec->updated_at_ms == kNow + 2000);
  // stored content is kept on a changed rescrape
  assert(rec->content_hash == strata::util::Sha256Hex(req.raw_text()));
  assert(h.repo->CountBlobs(*tx, rec->id) == 1);
  tx->Rollback();
}

void TestConcurrentIngestOfOneLocatorYieldsOneRecord() {
  Harness h;
  const auto req = MakeRequest("https://example.com/tech/race", strata::testing::TechArticle(2048), "technology");

  constexpr int            kWriters = 8;
  std::vector<std::string> ids(kWriters);
  std::vector<std::thread> threads;
  for (int i = 0; i < kWriters; ++i) {
    threads.emplace_back([&, i] { ids[i] = h.coordinator.Ingest(req, kNow).record_id(); });
  }
  for (auto& t : threads) t.join();

  const std::set<std::string> distinct(ids.begin(), ids.end());
  assert(distinct.size() == 1);

  auto tx = h.repo->Begin();
  assert(h.repo->CountRecords(*tx, {}) == 1);
  auto rec = h.repo->GetRecord(*tx, ids[0]);
  assert(rec->scrape_count == kWriters);
  tx->Rollback();
}

void TestInvalidRequestsWriteNothing() {
  Harness h;

  auto expect_invalid = [&](const v1::IngestRequest& req) {
    bool threw = false;
    try {
      (void)h.coordinator.Ingest(req, kNow);
    } catch (const strata::util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  };

  expect_invalid(MakeRequest("https://example.com/a", "   ", "general"));
  expect_invalid(MakeRequest("", "body", "general"));

  auto bad_metadata = MakeRequest("https://example.com/b", "body", "general");
  bad_metadata.set_metadata_json("[1, 2, 3]");
  expect_invalid(bad_metadata);

  auto tx = h.repo->Begin();
  assert(h.repo->CountRecords(*tx, {}) == 0);
  tx->Rollback();
}

void TestSweepRemovesStaleOrphans() {
  Harness h;
  h.vectors->EnsureCollection("test_chunks", h.embedder->Dimension());

  strata::db::model::StagedBatch stale;
  stale.batch_id        = "batch-stale";
  stale.record_id       = "record-gone";
  stale.collection      = "test_chunks";
  stale.expected_chunks = 1;
  stale.created_at_ms   = kNow - 2 * kHour;

  strata::vector::VectorPoint point;
  point.id               = "point-stale";
  point.vector           = h.embedder->Embed("orphan");
  point.payload.batch_id = stale.batch_id;
  h.vectors->Upsert("test_chunks", {point});

  strata::db::model::BlobRecord blob;
  blob.owner_record_id = "record-gone";
  blob.content_hash    = "hash";
  blob.body            = "orphan";
  blob.created_at_ms   = kNow - 2 * kHour;

  {
    auto tx = h.repo->Begin();
    const auto batch_res = h.repo->InsertBatch(*tx, stale);
    const auto blob_res  = h.repo->InsertBlob(*tx, blob);
    assert(batch_res && blob_res);
    tx->Commit();
  }

  const auto report = h.coordinator.SweepOrphans(kNow);
  assert(report.batches == 1);
  assert(report.blobs == 1);
  assert(h.vectors->Count("test_chunks") == 0);

  auto tx = h.repo->Begin();
  assert(!h.repo->GetBatch(*tx, "batch-stale"));
  tx->Rollback();
}

} // namespace

int main() {
  TestTechArticleIsFullStored();
  TestLargeLiteratureBookIsVectorStored();
  TestDenseContentLandsInSpecializedTable();
  TestMetadataOnlyWritesNoLegs();
  TestHybridWritesBlobAndVectors();
  TestReingestIsIdempotent();
  TestConcurrentIngestOfOneLocatorYieldsOneRecord();
  TestInvalidRequestsWriteNothing();
  TestSweepRemovesStaleOrphans();

  std::cout << "strata_unit_storage_coordinator: pass\n";
  return 0;
}
