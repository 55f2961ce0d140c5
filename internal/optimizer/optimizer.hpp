#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/migration/migration_scheduler.hpp"
#include "internal/placement/placement_policy.hpp"
#include "internal/schema/table_registry.hpp"
#include "strata/engine/v1.hpp"

namespace strata::optimizer {

struct OptimizerOptions {
  uint64_t window_ms             = 24ULL * 3600 * 1000;
  uint32_t min_samples           = 10;
  double   latency_threshold_ms  = 500.0;
  uint64_t recommendation_ttl_ms = 7ULL * 24 * 3600 * 1000;
  uint32_t max_dynamic_tables    = 50;
};

/*
  Turns performance samples and placement state into recommendations
  and applies them.

  Heuristics (all values clamped):
    ADD_INDEX          improvement = 100 * (1 - threshold / mean latency), max 60
                       confidence  = 0.5 + 0.45 * min(1, samples / (4 * min_samples))
    MIGRATE_STRATEGY   improvement = 40 * non-hybrid share
                       confidence  = 0.3 + 0.6 * non-hybrid share
    STALE_POLICY       improvement = 10,  confidence = 0.7
    CONSOLIDATE_TABLES improvement = 15,  confidence = 0.6

  Applying never touches records directly: strategy changes go through
  the migration scheduler and the consistency mapper.
*/
class Optimizer {
 public:
  Optimizer(db::Repository& repo, const placement::PlacementPolicy& policy, schema::TableRegistry& tables,
            migration::MigrationScheduler& migrations, OptimizerOptions options);

  // Persists and returns every recommendation produced, conflicts included.
  std::vector<db::model::RecommendationRecord> Evaluate(uint64_t now_ms);

  // PENDING recommendations older than the ttl become EXPIRED; REJECTED and
  // EXPIRED rows untouched for a ttl are deleted.
  uint64_t ExpireStale(uint64_t now_ms);

  // InvalidState unless the recommendation is PENDING.
  strata::engine::v1::ApplyRecommendationResponse Apply(const std::string& id, uint64_t now_ms);

  std::vector<db::model::RecommendationRecord> List(strata::engine::v1::RecommendationStatus status);

  strata::engine::v1::StorageAnalytics Analytics();

 private:
  db::model::RecommendationRecord Persist(db::model::RecommendationRecord rec, uint64_t now_ms);

  struct Plan {
    std::vector<std::pair<std::string, strata::engine::v1::Strategy>> moves;
    uint32_t                                                           skipped = 0;
  };
  Plan PlanMigrations(const db::model::RecommendationRecord& rec);

  db::Repository&                   repo_;
  const placement::PlacementPolicy& policy_;
  schema::TableRegistry&            tables_;
  migration::MigrationScheduler&    migrations_;
  OptimizerOptions                  options_;
};

// Recommendation row to its wire form.
strata::engine::v1::Recommendation ToProto(const db::model::RecommendationRecord& rec);

} // namespace strata::optimizer
