#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/embedding/embedder.hpp"
#include "internal/optimizer/performance_tracker.hpp"
#include "internal/util/worker_pool.hpp"
#include "internal/vector/vector_store.hpp"
#include "strata/engine/v1.hpp"

namespace strata::query {

struct QueryOptions {
  std::string collection;
  double      alpha                 = 0.5;
  uint32_t    vector_top_k          = 50;
  double      min_vector_similarity = 0.0;
  uint64_t    subquery_timeout_ms   = 2000;
  uint64_t    default_deadline_ms   = 5000;
  uint32_t    default_limit         = 10;
};

struct ScoredId {
  std::string record_id;
  double      score = 0.0;
};

/*
  Merges per-record score lists.

  Each list is scaled by its maximum, then combined as
  alpha * text + (1 - alpha) * vector with a missing side counting as
  zero. Ordered by score descending, then record id.
*/
std::vector<strata::engine::v1::QueryHit> MergeScores(const std::vector<ScoredId>& text, const std::vector<ScoredId>& vector,
                                                      double alpha);

/*
  Hybrid retrieval over the relational full-text index and the vector
  store.

  Sub-queries run on the shared pool with their own cancel token and
  timeout. Tasks own copies of everything they touch, so a timed-out
  sub-query may finish after Query has returned.
*/
class QueryPlanner {
 public:
  QueryPlanner(db::Repository& repo, vector::VectorStore& vectors, const embedding::Embedder& embedder, util::WorkerPool& pool,
               optimizer::PerformanceTracker* tracker, QueryOptions options);

  strata::engine::v1::QueryResponse Query(const strata::engine::v1::QueryRequest& request);
  strata::engine::v1::QueryResponse Query(const strata::engine::v1::QueryRequest& request, uint64_t now_ms);

 private:
  db::Repository&                repo_;
  vector::VectorStore&           vectors_;
  const embedding::Embedder&     embedder_;
  util::WorkerPool&              pool_;
  optimizer::PerformanceTracker* tracker_;
  QueryOptions                   options_;
};

} // namespace strata::query
