#include "internal/query/query_planner.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/optimizer/performance_tracker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/worker_pool.hpp"
#include "support/test_support.hpp"

namespace {

namespace v1 = strata::engine::v1;

using strata::query::MergeScores;
using strata::query::QueryOptions;
using strata::query::QueryPlanner;
using strata::testing::Harness;
using strata::testing::MakeRequest;

constexpr uint64_t kMiB = 1024 * 1024;
constexpr uint64_t kNow = 1'700'000'000'000ULL;

std::shared_ptr<strata::testing::StubEmbedder> ConceptEmbedder() {
  return std::make_shared<strata::testing::StubEmbedder>(
      std::vector<strata::testing::StubEmbedder::Rule>{
          {"consciousness", {1.0f, 0.0f, 0.0f, 0.0f}},
          {"awareness", {0.9f, 0.1f, 0.0f, 0.0f}},
      },
      std::vector<float>{0.0f, 0.0f, 1.0f, 0.0f});
}

QueryOptions Options(uint64_t subquery_timeout_ms = 2000) {
  QueryOptions options;
  options.collection            = "test_chunks";
  options.alpha                 = 0.5;
  options.vector_top_k          = 50;
  options.min_vector_similarity = 0.5;
  options.subquery_timeout_ms   = subquery_timeout_ms;
  options.default_deadline_ms   = 5000;
  options.default_limit         = 10;
  return options;
}

v1::QueryRequest Request(const std::string& text, v1::QueryMode mode) {
  v1::QueryRequest req;
  req.set_text(text);
  req.set_mode(mode);
  return req;
}

struct Corpus {
  std::string text_only;   // full store, mentions the term
  std::string vector_only; // vectorized, related wording only
  std::string weak_text;   // full store, term buried in a long body
};

Corpus Seed(Harness& h) {
  Corpus c;
  c.text_only = h.coordinator
                    .Ingest(MakeRequest("https://example.com/essays/x", "The study of consciousness in modern thought.",
                                        "philosophy"),
                            kNow)
                    .record_id();
  c.vector_only = h.coordinator
                      .Ingest(MakeRequest("https://example.com/essays/y", "Perceptual awareness emerges from neural activity.",
                                          "philosophy", 60 * kMiB),
                              kNow)
                      .record_id();
  c.weak_text = h.coordinator
                    .Ingest(MakeRequest("https://example.com/essays/z",
                                        "consciousness " + strata::testing::TechArticle(3000), "philosophy"),
                            kNow)
                    .record_id();

  assert(h.Get(c.text_only)->strategy == v1::STRATEGY_FULL_STORE);
  assert(h.Get(c.vector_only)->strategy == v1::STRATEGY_VECTOR_STORE);
  assert(h.Get(c.weak_text)->strategy == v1::STRATEGY_FULL_STORE);
  return c;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestMergeNormalizesAndOrders() {
  const auto hits = MergeScores({{"a", 2.0}, {"b", 1.0}}, {{"b", 0.5}, {"c", 0.25}}, 0.5);
  assert(hits.size() == 3);
  assert(hits[0].record_id() == "b" && Near(hits[0].score(), 0.75));
  assert(hits[1].record_id() == "a" && Near(hits[1].score(), 0.5));
  assert(hits[2].record_id() == "c" && Near(hits[2].score(), 0.25));

  // equal scores fall back to id order
  const auto tied = MergeScores({{"m", 1.0}}, {{"k", 1.0}}, 0.5);
  assert(tied[0].record_id() == "k");
  assert(tied[1].record_id() == "m");
}

void TestHybridReturnsTextOnlyAndVectorOnlyMatches() {
  Harness                  h(std::make_shared<strata::vector::MemoryVectorStore>(), ConceptEmbedder());
  const auto               corpus = Seed(h);
  strata::util::WorkerPool pool(2);
  QueryPlanner             planner(*h.repo, *h.vectors, *h.embedder, pool, nullptr, Options());

  const auto resp = planner.Query(Request("consciousness", v1::QUERY_MODE_HYBRID), kNow);
  assert(!resp.partial());
  assert(resp.text_status() == v1::SUB_QUERY_STATUS_OK);
  assert(resp.vector_status() == v1::SUB_QUERY_STATUS_OK);
  assert(resp.executed_mode() == v1::QUERY_MODE_HYBRID);
  assert(resp.hits_size() == 3);

  const std::set<std::string> top{resp.hits(0).record_id(), resp.hits(1).record_id()};
  assert(top.count(corpus.text_only) == 1);
  assert(top.count(corpus.vector_only) == 1);
  assert(resp.hits(2).record_id() == corpus.weak_text);

  // both best hits carry one normalized side at weight 0.5
  assert(Near(resp.hits(0).score(), 0.5));
  assert(Near(resp.hits(1).score(), 0.5));
  assert(resp.hits(0).record_id() < resp.hits(1).record_id());
  assert(resp.hits(2).score() < 0.5);

  for (const auto& hit : resp.hits()) {
    if (hit.record_id() == corpus.vector_only) {
      assert(Near(hit.vector_score(), 1.0) && hit.text_score() == 0.0);
      assert(hit.strategy() == v1::STRATEGY_VECTOR_STORE);
    }
    if (hit.record_id() == corpus.text_only) {
      assert(Near(hit.text_score(), 1.0) && hit.vector_score() == 0.0);
    }
  }
}

void TestTextModeSkipsVectors() {
  Harness                  h(std::make_shared<strata::vector::MemoryVectorStore>(), ConceptEmbedder());
  const auto               corpus = Seed(h);
  strata::util::WorkerPool pool(2);
  QueryPlanner             planner(*h.repo, *h.vectors, *h.embedder, pool, nullptr, Options());

  // AUTO without the semantic flag runs full text only
  const auto resp = planner.Query(Request("consciousness", v1::QUERY_MODE_AUTO), kNow);
  assert(resp.executed_mode() == v1::QUERY_MODE_TEXT);
  assert(resp.vector_status() == v1::SUB_QUERY_STATUS_NOT_RUN);
  assert(!resp.partial());
  assert(resp.hits_size() == 2);
  assert(resp.hits(0).record_id() == corpus.text_only);
  assert(!resp.hits(0).snippet().empty());

  auto semantic = Request("consciousness", v1::QUERY_MODE_AUTO);
  semantic.set_semantic(true);
  assert(planner.Query(semantic, kNow).executed_mode() == v1::QUERY_MODE_HYBRID);
}

void TestFiltersAndPagination() {
  Harness                  h(std::make_shared<strata::vector::MemoryVectorStore>(), ConceptEmbedder());
  const auto               corpus = Seed(h);
  strata::util::WorkerPool pool(2);
  QueryPlanner             planner(*h.repo, *h.vectors, *h.embedder, pool, nullptr, Options());

  auto other_domain = Request("consciousness", v1::QUERY_MODE_HYBRID);
  other_domain.mutable_filters()->set_domain("technology");
  assert(planner.Query(other_domain, kNow).hits_size() == 0);

  auto paged = Request("consciousness", v1::QUERY_MODE_HYBRID);
  paged.set_limit(1);
  paged.set_offset(2);
  const auto page = planner.Query(paged, kNow);
  assert(page.hits_size() == 1);
  assert(page.hits(0).record_id() == corpus.weak_text);
}

void TestSlowVectorLegGivesPartialResult() {
  Harness h(std::make_shared<strata::testing::SlowVectorStore>(std::chrono::milliseconds(300)), ConceptEmbedder());
  const auto corpus = Seed(h);
  // declared after the harness so queued sub-queries drain before it goes
  strata::util::WorkerPool pool(2);
  QueryPlanner             planner(*h.repo, *h.vectors, *h.embedder, pool, nullptr, Options(50));

  const auto resp = planner.Query(Request("consciousness", v1::QUERY_MODE_HYBRID), kNow);
  assert(resp.partial());
  assert(resp.text_status() == v1::SUB_QUERY_STATUS_OK);
  assert(resp.vector_status() == v1::SUB_QUERY_STATUS_TIMED_OUT);
  assert(resp.hits_size() == 2);
  assert(resp.hits(0).record_id() == corpus.text_only);
  // text side ranked alone
  assert(Near(resp.hits(0).score(), 1.0));

  bool threw = false;
  try {
    (void)planner.Query(Request("consciousness", v1::QUERY_MODE_VECTOR), kNow);
  } catch (const strata::util::DeadlineExceeded&) {
    threw = true;
  }
  assert(threw);
}

void TestVectorQueryBeforeAnyVectors() {
  Harness                  h(std::make_shared<strata::vector::MemoryVectorStore>(), ConceptEmbedder());
  strata::util::WorkerPool pool(1);
  QueryPlanner             planner(*h.repo, *h.vectors, *h.embedder, pool, nullptr, Options());

  const auto resp = planner.Query(Request("consciousness", v1::QUERY_MODE_VECTOR), kNow);
  assert(resp.vector_status() == v1::SUB_QUERY_STATUS_OK);
  assert(resp.hits_size() == 0);

  bool threw = false;
  try {
    (void)planner.Query(Request("   ", v1::QUERY_MODE_TEXT), kNow);
  } catch (const strata::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestQueriesFeedTheTracker() {
  Harness                           h(std::make_shared<strata::vector::MemoryVectorStore>(), ConceptEmbedder());
  const auto                        corpus = Seed(h);
  strata::optimizer::TrackerOptions tracker_options;
  tracker_options.latency_threshold_ms = 1e9;
  strata::optimizer::PerformanceTracker tracker(*h.repo, tracker_options);
  strata::util::WorkerPool              pool(2);
  QueryPlanner                          planner(*h.repo, *h.vectors, *h.embedder, pool, &tracker, Options());

  (void)planner.Query(Request("consciousness", v1::QUERY_MODE_HYBRID), kNow);
  (void)planner.Query(Request("consciousness", v1::QUERY_MODE_TEXT), kNow + 1);
  tracker.Flush();

  {
    auto tx      = h.repo->Begin();
    auto samples = h.repo->ListSamples(*tx, 0);
    tx->Rollback();
    assert(samples.size() == 2);
    assert(samples[0].domain == "philosophy");
    assert(!samples[0].signature.empty());
  }

  const auto rec = h.Get(corpus.text_only);
  assert(rec->query_count == 2);
  assert(rec->last_queried_at_ms == kNow + 1);

  const auto report = tracker.Report(kNow + 10);
  assert(report.domains_size() == 1);
  assert(report.domains(0).domain() == "philosophy");
  assert(report.domains(0).total_queries() == 2);
  assert(report.domains(0).slow_queries() == 0);
}

} // namespace

int main() {
  TestMergeNormalizesAndOrders();
  TestHybridReturnsTextOnlyAndVectorOnlyMatches();
  TestTextModeSkipsVectors();
  TestFiltersAndPagination();
  TestSlowVectorLegGivesPartialResult();
  TestVectorQueryBeforeAnyVectors();
  TestQueriesFeedTheTracker();

  std::cout << "strata_unit_query_planner: pass\n";
  return 0;
}
