#include "internal/consistency/consistency_mapper.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/model/strategy.hpp"
#include "internal/util/cancel.hpp"
#include "internal/util/errors.hpp"
#include "support/test_support.hpp"

namespace {

namespace v1 = strata::engine::v1;

using strata::consistency::MigrationOutcome;
using strata::testing::Harness;
using strata::testing::MakeRequest;

constexpr uint64_t kMiB   = 1024 * 1024;
constexpr uint64_t kNow   = 1'700'000'000'000ULL;
constexpr uint64_t kGrace = 60 * 1000;

// Accepts writes but never returns them on read-back.
class ForgetfulVectorStore final : public strata::vector::VectorStore {
 public:
  void EnsureCollection(const std::string& collection, uint32_t dimension) override {
    inner_.EnsureCollection(collection, dimension);
  }
  void Upsert(const std::string& collection, const std::vector<strata::vector::VectorPoint>& points) override {
    inner_.Upsert(collection, points);
  }
  std::vector<strata::vector::ScoredPoint> Search(const std::string& collection, const std::vector<float>& query,
                                                  const strata::vector::VectorFilter& filter, std::size_t top_k) override {
    return inner_.Search(collection, query, filter, top_k);
  }
  std::vector<strata::vector::VectorPoint> Retrieve(const std::string&, const std::vector<std::string>&) override {
    return {};
  }
  uint64_t DeletePoints(const std::string& collection, const std::vector<std::string>& ids) override {
    return inner_.DeletePoints(collection, ids);
  }
  uint64_t DeleteByBatch(const std::string& collection, const std::string& batch_id) override {
    return inner_.DeleteByBatch(collection, batch_id);
  }
  uint64_t Count(const std::string& collection) override {
    return inner_.Count(collection);
  }

 private:
  strata::vector::MemoryVectorStore inner_;
};

std::string IngestFullStore(Harness& h, const std::string& locator, const std::string& text) {
  const auto resp = h.coordinator.Ingest(MakeRequest(locator, text, "technology"), kNow);
  assert(resp.strategy() == v1::STRATEGY_FULL_STORE);
  return resp.record_id();
}

void TestReadyPointerResolvesAndVerifies() {
  Harness    h;
  const auto text = strata::testing::RepetitiveText(30);
  const auto resp = h.coordinator.Ingest(MakeRequest("https://example.com/journal/a", text, "science", 2 * kMiB), kNow);
  assert(resp.strategy() == v1::STRATEGY_HYBRID);

  const auto rec = h.mapper.ResolveReadable(resp.record_id());
  assert(rec);
  assert(h.mapper.Verify(*rec).ok);

  const auto content = h.legs.ReadContent(rec->id, strata::legs::Location::Of(*rec));
  assert(content && *content == text);
  assert(!h.mapper.ResolveReadable("missing"));
}

void TestMigrateSwapsPointerAndDefersOldLegs() {
  Harness    h;
  const auto text = strata::testing::TechArticle(5000);
  const auto id   = IngestFullStore(h, "https://example.com/tech/migrate", text);
  const auto old  = h.Get(id);

  strata::util::CancelToken cancel;
  const auto outcome = h.mapper.Migrate(id, v1::STRATEGY_VECTOR_STORE, 1, cancel, kNow + 10);
  assert(outcome == MigrationOutcome::kSucceeded);

  const auto rec = h.Get(id);
  assert(rec->strategy == v1::STRATEGY_VECTOR_STORE);
  assert(rec->status == v1::RECORD_STATUS_READY);
  assert(rec->blob_hash.empty());
  assert(rec->chunk_count > 1);
  assert(h.mapper.Verify(*rec).ok);

  // body reassembled from overlapping chunks
  const auto content = h.legs.ReadContent(id, strata::legs::Location::Of(*rec));
  assert(content && *content == text);

  // old blob stays until the grace period passes
  {
    auto tx = h.repo->Begin();
    assert(h.repo->GetBlob(*tx, id, old->blob_hash));
    assert(h.repo->ListGarbage(*tx, 0).size() == 1);
    tx->Rollback();
  }
  assert(h.mapper.CollectGarbage(kNow + 20) == 0);
  assert(h.mapper.CollectGarbage(kNow + 10 + kGrace) == 1);

  auto tx = h.repo->Begin();
  assert(h.repo->CountBlobs(*tx, id) == 0);
  assert(h.repo->ListGarbage(*tx, 0).empty());
  tx->Rollback();
}

void TestMigrateBackToBlobReassemblesBody() {
  Harness    h;
  const auto text = strata::testing::RepetitiveText(60);
  const auto resp = h.coordinator.Ingest(MakeRequest("https://example.com/library/b", text, "literature", 60 * kMiB), kNow);
  assert(resp.strategy() == v1::STRATEGY_VECTOR_STORE);

  strata::util::CancelToken cancel;
  assert(h.mapper.Migrate(resp.record_id(), v1::STRATEGY_FULL_STORE, 1, cancel, kNow + 1) == MigrationOutcome::kSucceeded);

  const auto rec = h.Get(resp.record_id());
  assert(rec->strategy == v1::STRATEGY_FULL_STORE);
  assert(rec->vector_batch_id.empty());

  auto tx   = h.repo->Begin();
  auto blob = h.repo->GetBlob(*tx, rec->id, rec->blob_hash);
  tx->Rollback();
  assert(blob && blob->body == text);
}

void TestCancelledMigrationKeepsOriginal() {
  Harness    h;
  const auto id = IngestFullStore(h, "https://example.com/tech/cancel", strata::testing::TechArticle(3000));

  strata::util::CancelToken cancel;
  cancel.Cancel();
  assert(h.mapper.Migrate(id, v1::STRATEGY_VECTOR_STORE, 1, cancel, kNow + 1) == MigrationOutcome::kCancelled);

  const auto rec = h.Get(id);
  assert(rec->strategy == v1::STRATEGY_FULL_STORE);
  assert(rec->status == v1::RECORD_STATUS_READY);
  assert(rec->vector_batch_id.empty());
  assert(h.mapper.Verify(*rec).ok);
  assert(h.vectors->Count("test_chunks") == 0);
}

void TestFailedVerificationRecordsIncident() {
  Harness    h(std::make_shared<ForgetfulVectorStore>());
  const auto id = IngestFullStore(h, "https://example.com/tech/verify", strata::testing::TechArticle(3000));

  bool threw = false;
  try {
    strata::util::CancelToken cancel;
    (void)h.mapper.Migrate(id, v1::STRATEGY_VECTOR_STORE, 1, cancel, kNow + 1);
  } catch (const strata::util::ConsistencyViolation&) {
    threw = true;
  }
  assert(threw);

  const auto rec = h.Get(id);
  assert(rec->strategy == v1::STRATEGY_FULL_STORE);
  assert(rec->status == v1::RECORD_STATUS_READY);

  auto tx        = h.repo->Begin();
  auto incidents = h.repo->ListIncidents(*tx, 0);
  tx->Rollback();
  assert(incidents.size() == 1);
  assert(incidents[0].kind == "consistency_violation");
  assert(incidents[0].record_id == id);
}

void TestFailedWriteDuringMigrationKeepsOriginal() {
  auto       failing = std::make_shared<strata::testing::FailingVectorStore>();
  Harness    h(failing);
  const auto id = IngestFullStore(h, "https://example.com/tech/flaky", strata::testing::TechArticle(3000));

  bool threw = false;
  try {
    strata::util::CancelToken cancel;
    (void)h.mapper.Migrate(id, v1::STRATEGY_VECTOR_STORE, 1, cancel, kNow + 1);
  } catch (const strata::util::TransientStoreError&) {
    threw = true;
  }
  assert(threw);

  const auto rec = h.Get(id);
  assert(rec->status == v1::RECORD_STATUS_READY);
  assert(rec->strategy == v1::STRATEGY_FULL_STORE);
  assert(h.mapper.Verify(*rec).ok);
}

void TestMigrateRejectsUnmovableRecords() {
  Harness h;

  const auto meta = h.coordinator.Ingest(
      MakeRequest("https://example.com/misc/meta", strata::testing::RepetitiveText(10), "general", 2 * kMiB), kNow);
  assert(meta.strategy() == v1::STRATEGY_METADATA_ONLY);

  bool threw = false;
  try {
    strata::util::CancelToken cancel;
    (void)h.mapper.Migrate(meta.record_id(), v1::STRATEGY_FULL_STORE, 1, cancel, kNow + 1);
  } catch (const strata::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    strata::util::CancelToken cancel;
    (void)h.mapper.Migrate("missing", v1::STRATEGY_FULL_STORE, 1, cancel, kNow + 1);
  } catch (const strata::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // same strategy under a newer policy only restamps the version
  const auto id = IngestFullStore(h, "https://example.com/tech/restamp", strata::testing::TechArticle(3000));
  strata::util::CancelToken cancel;
  assert(h.mapper.Migrate(id, v1::STRATEGY_FULL_STORE, 2, cancel, kNow + 1) == MigrationOutcome::kUnchanged);
  assert(h.Get(id)->policy_version == 2);
}

void TestLocatorConflictDiscardsStagedLegs() {
  Harness h;
  IngestFullStore(h, "https://example.com/tech/owned", strata::testing::TechArticle(2000));

  strata::db::model::ContentRecord loser;
  loser.id             = "loser";
  loser.source_locator = "https://example.com/tech/owned";
  loser.strategy       = v1::STRATEGY_FULL_STORE;

  strata::legs::WrittenLegs written;
  written.requested          = strata::model::kLegBlob;
  written.written            = strata::model::kLegBlob;
  written.location.blob_hash = "staged-hash";

  assert(!h.mapper.PublishIngest(loser, written, "body", kNow));

  auto tx      = h.repo->Begin();
  auto garbage = h.repo->ListGarbage(*tx, 0);
  tx->Rollback();
  assert(garbage.size() == 1);
  assert(garbage[0].record_id == "loser");
  assert(garbage[0].ref == "staged-hash");
}

void TestStatusChangesFollowLifecycle() {
  using strata::model::CanTransition;
  assert(CanTransition(v1::RECORD_STATUS_UNSPECIFIED, v1::RECORD_STATUS_READY));
  assert(CanTransition(v1::RECORD_STATUS_UNSPECIFIED, v1::RECORD_STATUS_DEGRADED));
  assert(!CanTransition(v1::RECORD_STATUS_UNSPECIFIED, v1::RECORD_STATUS_MIGRATING));
  assert(CanTransition(v1::RECORD_STATUS_READY, v1::RECORD_STATUS_MIGRATING));
  assert(!CanTransition(v1::RECORD_STATUS_DEGRADED, v1::RECORD_STATUS_MIGRATING));
  assert(!CanTransition(v1::RECORD_STATUS_MIGRATING, v1::RECORD_STATUS_DEGRADED));

  bool threw = false;
  try {
    (void)strata::model::CheckedTransition("r1", v1::RECORD_STATUS_DEGRADED, v1::RECORD_STATUS_MIGRATING);
  } catch (const strata::util::InvalidState& e) {
    threw = std::string(e.what()).find("degraded -> migrating") != std::string::npos;
  }
  assert(threw);

  // a record that claims to be mid-migration cannot be published degraded
  Harness                          h;
  strata::db::model::ContentRecord replayed;
  replayed.id             = "replayed";
  replayed.source_locator = "https://example.com/tech/replayed";
  replayed.strategy       = v1::STRATEGY_HYBRID;
  replayed.status         = v1::RECORD_STATUS_MIGRATING;

  strata::legs::WrittenLegs written;
  written.requested          = strata::model::kLegBlob | strata::model::kLegVectors;
  written.written            = strata::model::kLegBlob;
  written.location.blob_hash = "staged-hash";

  threw = false;
  try {
    (void)h.mapper.PublishIngest(replayed, written, "body", kNow);
  } catch (const strata::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(!h.Get("replayed").has_value());
}

void TestAnalysisReadIncludesAnnotations() {
  Harness    h;
  const auto text = strata::testing::TechArticle(1500);
  const auto id   = IngestFullStore(h, "https://example.com/tech/annotated", text);

  {
    strata::db::model::Annotation a;
    a.record_id     = id;
    a.agent         = "summarizer";
    a.json          = R"({"summary":"short"})";
    a.updated_at_ms = kNow;
    auto       tx  = h.repo->Begin();
    const auto res = h.repo->UpsertAnnotation(*tx, a);
    assert(res);
    tx->Commit();
  }

  const auto view = h.mapper.ReadForAnalysis(id);
  assert(view.content && *view.content == text);
  assert(view.annotations.at("summarizer") == R"({"summary":"short"})");
}

} // namespace

int main() {
  TestReadyPointerResolvesAndVerifies();
  TestMigrateSwapsPointerAndDefersOldLegs();
  TestMigrateBackToBlobReassemblesBody();
  TestCancelledMigrationKeepsOriginal();
  TestFailedVerificationRecordsIncident();
  TestFailedWriteDuringMigrationKeepsOriginal();
  TestMigrateRejectsUnmovableRecords();
  TestLocatorConflictDiscardsStagedLegs();
  TestStatusChangesFollowLifecycle();
  TestAnalysisReadIncludesAnnotations();

  std::cout << "strata_unit_consistency_mapper: pass\n";
  return 0;
}
