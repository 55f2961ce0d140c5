#include "internal/reconcile/reconciler.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/model/strategy.hpp"
#include "support/test_support.hpp"

namespace {

namespace v1 = strata::engine::v1;

using strata::reconcile::Reconciler;
using strata::reconcile::ReconcilerOptions;
using strata::testing::FailingVectorStore;
using strata::testing::Harness;
using strata::testing::MakeRequest;

constexpr uint64_t kMiB = 1024 * 1024;
constexpr uint64_t kNow = 1'700'000'000'000ULL;

const ReconcilerOptions kFastRepair{3, 10, 40};

std::string IngestHybrid(Harness& h, const std::string& text) {
  const auto resp =
      h.coordinator.Ingest(MakeRequest("https://example.com/journal/degraded", text, "science", 2 * kMiB), kNow);
  assert(resp.strategy() == v1::STRATEGY_HYBRID);
  return resp.record_id();
}

void TestFailingVectorLegDegradesThenFlagsForReview() {
  auto    failing = std::make_shared<FailingVectorStore>();
  Harness h(failing);

  const auto text = strata::testing::RepetitiveText(30);
  const auto id   = IngestHybrid(h, text);

  // blob leg committed, vector leg failed after retries
  auto rec = h.Get(id);
  assert(rec->status == v1::RECORD_STATUS_DEGRADED);
  assert(!rec->blob_hash.empty());
  assert(rec->vector_batch_id.empty());
  assert(!rec->needs_review);
  {
    auto tx   = h.repo->Begin();
    auto task = h.repo->GetRepairTask(*tx, id);
    tx->Rollback();
    assert(task);
    assert(task->state == v1::REPAIR_STATE_PENDING);
    assert(task->missing_legs == strata::model::kLegVectors);
    assert(task->content == text);
  }

  // degraded records stay readable
  assert(h.mapper.ResolveReadable(id));

  Reconciler reconciler(*h.repo, h.legs, h.mapper, kFastRepair);
  uint64_t   now = kNow;
  for (int attempt = 1; attempt <= 3; ++attempt) {
    const auto report = reconciler.RunOnce(now);
    assert(report.attempted == 1);
    assert(report.repaired == 0);
    assert(report.fatal == (attempt == 3 ? 1u : 0u));
    now += 1000;
  }

  // nothing due after exhaustion
  assert(reconciler.RunOnce(now + 1000000).attempted == 0);

  rec = h.Get(id);
  assert(rec);
  assert(rec->status == v1::RECORD_STATUS_DEGRADED);
  assert(rec->needs_review);

  auto tx        = h.repo->Begin();
  auto task      = h.repo->GetRepairTask(*tx, id);
  auto incidents = h.repo->ListIncidents(*tx, 0);
  tx->Rollback();
  assert(task && task->state == v1::REPAIR_STATE_FATAL);
  assert(task->attempts == 3);
  assert(!task->last_error.empty());
  assert(incidents.size() == 1);
  assert(incidents[0].kind == "repair_exhausted");
}

void TestBackoffDefersNextAttempt() {
  auto    failing = std::make_shared<FailingVectorStore>();
  Harness h(failing);
  const auto id = IngestHybrid(h, strata::testing::RepetitiveText(30));

  Reconciler reconciler(*h.repo, h.legs, h.mapper, kFastRepair);
  assert(reconciler.RunOnce(kNow).failed == 1);

  // rescheduled 10ms out
  assert(reconciler.RunOnce(kNow + 5).attempted == 0);
  assert(reconciler.RunOnce(kNow + 10).attempted == 1);

  auto tx   = h.repo->Begin();
  auto task = h.repo->GetRepairTask(*tx, id);
  tx->Rollback();
  assert(task->attempts == 2);
  assert(task->next_attempt_at_ms == kNow + 10 + 20);
}

void TestRecoveredStoreRepairsRecord() {
  auto    failing = std::make_shared<FailingVectorStore>();
  Harness h(failing);

  const auto text = strata::testing::RepetitiveText(30);
  const auto id   = IngestHybrid(h, text);
  assert(h.Get(id)->status == v1::RECORD_STATUS_DEGRADED);

  failing->fail_upserts = false;

  Reconciler reconciler(*h.repo, h.legs, h.mapper, kFastRepair);
  const auto report = reconciler.RunOnce(kNow + 1);
  assert(report.repaired == 1);

  const auto rec = h.Get(id);
  assert(rec->status == v1::RECORD_STATUS_READY);
  assert(!rec->vector_batch_id.empty());
  assert(rec->chunk_count > 1);
  assert(h.mapper.Verify(*rec).ok);

  auto tx = h.repo->Begin();
  assert(!h.repo->GetRepairTask(*tx, id));
  tx->Rollback();
}

} // namespace

int main() {
  TestFailingVectorLegDegradesThenFlagsForReview();
  TestBackoffDefersNextAttempt();
  TestRecoveredStoreRepairsRecord();

  std::cout << "strata_unit_reconciler: pass\n";
  return 0;
}
