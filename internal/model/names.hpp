#pragma once

#include <string_view>

#include "strata/engine/v1.hpp"

namespace strata::model {

constexpr std::string_view ToString(strata::engine::v1::QueryMode mode) {
  switch (mode) {
    case strata::engine::v1::QUERY_MODE_TEXT:
      return "text";
    case strata::engine::v1::QUERY_MODE_VECTOR:
      return "vector";
    case strata::engine::v1::QUERY_MODE_HYBRID:
      return "hybrid";
    default:
      return "auto";
  }
}

constexpr std::string_view ToString(strata::engine::v1::RecommendationType type) {
  switch (type) {
    case strata::engine::v1::RECOMMENDATION_TYPE_ADD_INDEX:
      return "add_index";
    case strata::engine::v1::RECOMMENDATION_TYPE_MIGRATE_STRATEGY:
      return "migrate_strategy";
    case strata::engine::v1::RECOMMENDATION_TYPE_STALE_POLICY:
      return "stale_policy";
    case strata::engine::v1::RECOMMENDATION_TYPE_CONSOLIDATE_TABLES:
      return "consolidate_tables";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(strata::engine::v1::RecommendationStatus status) {
  switch (status) {
    case strata::engine::v1::RECOMMENDATION_STATUS_PENDING:
      return "pending";
    case strata::engine::v1::RECOMMENDATION_STATUS_APPLIED:
      return "applied";
    case strata::engine::v1::RECOMMENDATION_STATUS_REJECTED:
      return "rejected";
    case strata::engine::v1::RECOMMENDATION_STATUS_FAILED:
      return "failed";
    case strata::engine::v1::RECOMMENDATION_STATUS_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

} // namespace strata::model
