#pragma once

#include <string_view>

#include "strata/engine/v1.hpp"

namespace strata::model {

using strata::engine::v1::Strategy;

constexpr std::string_view ToString(Strategy strategy) {
  switch (strategy) {
    case strata::engine::v1::STRATEGY_METADATA_ONLY:
      return "metadata_only";
    case strata::engine::v1::STRATEGY_FULL_STORE:
      return "full_store";
    case strata::engine::v1::STRATEGY_SPECIALIZED_TABLE:
      return "specialized_table";
    case strata::engine::v1::STRATEGY_VECTOR_STORE:
      return "vector_store";
    case strata::engine::v1::STRATEGY_HYBRID:
      return "hybrid";
    default:
      return "unspecified";
  }
}

// Relative storage cost. Enum values are declared cheapest first.
constexpr int Cost(Strategy strategy) {
  return static_cast<int>(strategy);
}

constexpr Strategy Cheaper(Strategy a, Strategy b) {
  return Cost(a) <= Cost(b) ? a : b;
}

constexpr unsigned kLegBlob     = strata::engine::v1::STORAGE_LEG_BLOB;
constexpr unsigned kLegVectors  = strata::engine::v1::STORAGE_LEG_VECTORS;
constexpr unsigned kLegTableRow = strata::engine::v1::STORAGE_LEG_TABLE_ROW;

constexpr unsigned LegsFor(Strategy strategy) {
  switch (strategy) {
    case strata::engine::v1::STRATEGY_FULL_STORE:
      return kLegBlob;
    case strata::engine::v1::STRATEGY_VECTOR_STORE:
      return kLegVectors;
    case strata::engine::v1::STRATEGY_HYBRID:
      return kLegBlob | kLegVectors;
    case strata::engine::v1::STRATEGY_SPECIALIZED_TABLE:
      return kLegTableRow;
    default:
      return 0;
  }
}

constexpr std::string_view LegName(unsigned leg) {
  switch (leg) {
    case kLegBlob:
      return "blob";
    case kLegVectors:
      return "vectors";
    case kLegTableRow:
      return "table_row";
    default:
      return "none";
  }
}

} // namespace strata::model
