#include "query_planner.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <map>
#include <utility>

#include "internal/model/names.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/cancel.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace strata::query {

namespace v1 = strata::engine::v1;

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr std::size_t kSnippetChars = 240;

std::vector<ScoredId> RunTextSearch(db::Repository* repo, const std::string& text, const db::model::RecordFilter& filter,
                                    std::size_t limit, const util::CancelToken& cancel) {
  cancel.ThrowIfCancelled("text search");
  auto tx   = repo->Begin();
  auto hits = repo->SearchText(*tx, text, filter, limit);
  tx->Rollback();

  std::vector<ScoredId> out;
  out.reserve(hits.size());
  for (auto& h : hits) out.push_back({std::move(h.record_id), h.rank});
  return out;
}

std::vector<ScoredId> RunVectorSearch(db::Repository* repo, vector::VectorStore* vectors, const embedding::Embedder* embedder,
                                      const QueryOptions& options, const std::string& text, const vector::VectorFilter& filter,
                                      const util::CancelToken& cancel) {
  const auto embedded = embedder->Embed(text);
  cancel.ThrowIfCancelled("vector search");

  std::vector<vector::ScoredPoint> points;
  try {
    points = vectors->Search(options.collection, embedded, filter, options.vector_top_k);
  } catch (const util::NotFound&) {
    // collection not created yet: nothing has been vectorized
    return {};
  }
  cancel.ThrowIfCancelled("vector search");

  // best similarity per (record, batch)
  std::map<std::pair<std::string, std::string>, double> best;
  for (const auto& p : points) {
    auto& s = best[{p.payload.record_id, p.payload.batch_id}];
    s       = std::max(s, p.score);
  }

  std::map<std::string, double> by_record;
  {
    auto tx = repo->Begin();
    for (const auto& [key, score] : best) {
      const auto& [record_id, batch_id] = key;
      auto rec                          = repo->GetRecord(*tx, record_id);
      // points of a superseded or not yet published batch are ignored
      if (!rec || !model::IsReadable(rec->status) || rec->vector_batch_id != batch_id) continue;
      if (score < options.min_vector_similarity) continue;
      auto& s = by_record[record_id];
      s       = std::max(s, score);
    }
    tx->Rollback();
  }

  std::vector<ScoredId> out;
  out.reserve(by_record.size());
  for (const auto& [id, score] : by_record) out.push_back({id, score});
  return out;
}

void Normalize(std::map<std::string, std::pair<double, double>>& merged, const std::vector<ScoredId>& list, bool text_side) {
  double max = 0.0;
  for (const auto& s : list) max = std::max(max, s.score);
  for (const auto& s : list) {
    const double norm = max > 0.0 ? s.score / max : 0.0;
    auto&        slot = text_side ? merged[s.record_id].first : merged[s.record_id].second;
    slot              = std::max(slot, norm);
  }
}

v1::SubQueryStatus Await(std::future<std::vector<ScoredId>>& fut, SteadyClock::time_point deadline,
                         const util::CancelToken& cancel, const char* leg, std::vector<ScoredId>& out) {
  if (fut.wait_until(deadline) != std::future_status::ready) {
    cancel.Cancel();
    STRATA_LOG_WARN("sub-query timed out", {StringField("leg", leg)});
    return v1::SUB_QUERY_STATUS_TIMED_OUT;
  }
  try {
    out = fut.get();
    return v1::SUB_QUERY_STATUS_OK;
  } catch (const std::exception& e) {
    STRATA_LOG_WARN("sub-query failed", {StringField("leg", leg), StringField("error", e.what())});
    return v1::SUB_QUERY_STATUS_FAILED;
  }
}

} // namespace

std::vector<v1::QueryHit> MergeScores(const std::vector<ScoredId>& text, const std::vector<ScoredId>& vector, double alpha) {
  std::map<std::string, std::pair<double, double>> merged;
  Normalize(merged, text, true);
  Normalize(merged, vector, false);

  std::vector<v1::QueryHit> hits;
  hits.reserve(merged.size());
  for (const auto& [id, scores] : merged) {
    v1::QueryHit h;
    h.set_record_id(id);
    h.set_text_score(scores.first);
    h.set_vector_score(scores.second);
    h.set_score(alpha * scores.first + (1.0 - alpha) * scores.second);
    hits.push_back(std::move(h));
  }
  std::sort(hits.begin(), hits.end(), [](const v1::QueryHit& a, const v1::QueryHit& b) {
    if (a.score() != b.score()) return a.score() > b.score();
    return a.record_id() < b.record_id();
  });
  return hits;
}

QueryPlanner::QueryPlanner(db::Repository& repo, vector::VectorStore& vectors, const embedding::Embedder& embedder,
                           util::WorkerPool& pool, optimizer::PerformanceTracker* tracker, QueryOptions options)
    : repo_(repo), vectors_(vectors), embedder_(embedder), pool_(pool), tracker_(tracker), options_(std::move(options)) {
}

v1::QueryResponse QueryPlanner::Query(const v1::QueryRequest& request) {
  return Query(request, util::NowMillis());
}

v1::QueryResponse QueryPlanner::Query(const v1::QueryRequest& request, uint64_t now_ms) {
  const auto started = SteadyClock::now();
  observability::SpanScope span("QueryPlanner.Query");

  const std::string text(util::Trim(request.text()));
  if (text.empty()) throw util::ValidationError("query text is required");

  auto mode = request.mode();
  if (mode == v1::QUERY_MODE_AUTO) mode = request.semantic() ? v1::QUERY_MODE_HYBRID : v1::QUERY_MODE_TEXT;
  const bool run_text   = mode == v1::QUERY_MODE_TEXT || mode == v1::QUERY_MODE_HYBRID;
  const bool run_vector = mode == v1::QUERY_MODE_VECTOR || mode == v1::QUERY_MODE_HYBRID;
  span.SetAttribute("mode", model::ToString(mode));

  const uint32_t limit        = request.limit() > 0 ? request.limit() : options_.default_limit;
  const uint64_t budget_ms    = request.deadline_ms() > 0 ? request.deadline_ms() : options_.default_deadline_ms;
  const auto     sub_deadline = started + std::chrono::milliseconds(std::min(budget_ms, options_.subquery_timeout_ms));

  db::model::RecordFilter filter;
  filter.domain            = request.filters().domain();
  filter.content_type      = request.filters().content_type();
  filter.created_after_ms  = request.filters().created_after_ms();
  filter.created_before_ms = request.filters().created_before_ms();

  vector::VectorFilter vfilter;
  vfilter.domain            = filter.domain;
  vfilter.content_type      = filter.content_type;
  vfilter.created_after_ms  = filter.created_after_ms;
  vfilter.created_before_ms = filter.created_before_ms;

  const std::size_t candidates = static_cast<std::size_t>(request.offset()) + limit + options_.vector_top_k;

  util::CancelToken                  text_cancel;
  util::CancelToken                  vector_cancel;
  std::future<std::vector<ScoredId>> text_future;
  std::future<std::vector<ScoredId>> vector_future;

  if (run_text) {
    text_future = pool_.Submit([repo = &repo_, text, filter, candidates, text_cancel] {
      return RunTextSearch(repo, text, filter, candidates, text_cancel);
    });
  }
  if (run_vector) {
    vector_future = pool_.Submit([repo = &repo_, vectors = &vectors_, embedder = &embedder_, options = options_, text, vfilter,
                                  vector_cancel] {
      return RunVectorSearch(repo, vectors, embedder, options, text, vfilter, vector_cancel);
    });
  }

  std::vector<ScoredId> text_hits;
  std::vector<ScoredId> vector_hits;
  auto text_status   = run_text ? Await(text_future, sub_deadline, text_cancel, "text", text_hits) : v1::SUB_QUERY_STATUS_NOT_RUN;
  auto vector_status = run_vector ? Await(vector_future, sub_deadline, vector_cancel, "vector", vector_hits)
                                  : v1::SUB_QUERY_STATUS_NOT_RUN;

  const bool text_ok   = text_status == v1::SUB_QUERY_STATUS_OK;
  const bool vector_ok = vector_status == v1::SUB_QUERY_STATUS_OK;
  if (!text_ok && !vector_ok) {
    throw util::DeadlineExceeded("no sub-query completed for mode " + std::string(model::ToString(mode)));
  }

  const bool partial = (run_text && !text_ok) || (run_vector && !vector_ok);
  double     alpha   = options_.alpha;
  if (!vector_ok) alpha = 1.0;
  if (!text_ok) alpha = 0.0;

  // a failed side contributes nothing; the surviving side is ranked alone
  const auto merged = MergeScores(text_hits, vector_hits, alpha);

  v1::QueryResponse response;
  response.set_partial(partial);
  response.set_text_status(text_status);
  response.set_vector_status(vector_status);
  response.set_executed_mode(mode);

  std::vector<std::string> returned;
  {
    auto tx = repo_.Begin();
    for (std::size_t i = request.offset(); i < merged.size() && returned.size() < limit; ++i) {
      auto rec = repo_.GetRecord(*tx, merged[i].record_id());
      if (!rec || !model::IsReadable(rec->status)) continue;

      auto* hit = response.add_hits();
      *hit      = merged[i];
      hit->set_title(rec->title);
      hit->set_domain(rec->domain);
      hit->set_content_type(rec->content_type);
      hit->set_strategy(rec->strategy);
      hit->set_snippet(util::Utf8Prefix(rec->preview, kSnippetChars));
      returned.push_back(rec->id);
    }
    tx->Rollback();
  }

  const double latency_ms = std::chrono::duration<double, std::milli>(SteadyClock::now() - started).count();
  response.set_latency_ms(latency_ms);

  auto& metrics = observability::Metrics::Instance();
  metrics.ObserveQueryLatencyMs(model::ToString(mode), latency_ms);
  if (partial) metrics.RecordPartialQuery();

  if (tracker_ != nullptr) {
    db::model::PerformanceSample sample;
    sample.signature     = util::ToHex(util::Fnv1a64(util::ToLower(text) + "|" + std::string(model::ToString(mode))));
    sample.mode          = mode;
    sample.domain        = !filter.domain.empty() ? filter.domain : (response.hits_size() > 0 ? response.hits(0).domain() : "");
    sample.strategy      = response.hits_size() > 0 ? response.hits(0).strategy() : v1::STRATEGY_UNSPECIFIED;
    sample.latency_ms    = latency_ms;
    sample.rows          = static_cast<uint64_t>(response.hits_size());
    sample.partial       = partial;
    sample.created_at_ms = now_ms;
    tracker_->Record(std::move(sample));
    tracker_->RecordAccess(returned, now_ms);
  }

  span.SetAttribute("hits", static_cast<std::int64_t>(response.hits_size()));
  span.SetAttribute("latency_ms", latency_ms);
  STRATA_LOG_DEBUG("query executed", {StringField("mode", model::ToString(mode)), IntField("hits", response.hits_size()),
                                      BoolField("partial", partial), DoubleField("latency_ms", latency_ms)});
  return response;
}

} // namespace strata::query
