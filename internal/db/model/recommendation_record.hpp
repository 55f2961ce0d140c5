#pragma once

#include <cstdint>
#include <string>

#include "strata/engine/v1.hpp"

namespace strata::db::model {

/*
  Optimizer output.

  At most one PENDING row per (type, target); a newer duplicate is
  stored as REJECTED.
*/
struct RecommendationRecord {
  std::string                            id;
  strata::engine::v1::RecommendationType type = strata::engine::v1::RECOMMENDATION_TYPE_UNSPECIFIED;
  std::string                            target;
  std::string                            description;

  strata::engine::v1::Strategy from_strategy = strata::engine::v1::STRATEGY_UNSPECIFIED;
  strata::engine::v1::Strategy to_strategy   = strata::engine::v1::STRATEGY_UNSPECIFIED;

  double estimated_improvement_pct = 0.0;
  double confidence                = 0.0;

  strata::engine::v1::RecommendationStatus status = strata::engine::v1::RECOMMENDATION_STATUS_PENDING;
  std::string                              detail;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace strata::db::model
