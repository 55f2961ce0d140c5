#pragma once

#include <cstdint>
#include <string>

#include "strata/engine/v1.hpp"

namespace strata::db::model {

/*
  Append-only query observation. Deleted only by the retention sweep.
*/
struct PerformanceSample {
  std::string                   signature;
  strata::engine::v1::QueryMode mode = strata::engine::v1::QUERY_MODE_AUTO;
  std::string                   domain;
  strata::engine::v1::Strategy  strategy = strata::engine::v1::STRATEGY_UNSPECIFIED;

  double   latency_ms = 0.0;
  uint64_t rows       = 0;
  bool     partial    = false;

  uint64_t created_at_ms = 0;
};

} // namespace strata::db::model
