#pragma once

#include <cstdint>
#include <string>

#include "strata/engine/v1.hpp"

namespace strata::db::model {

/*
  A set of chunk writes for one record.

  Created PENDING before the first chunk upload. The transition to
  COMPLETE is the completion marker and happens in the same transaction
  that publishes the pointer. PENDING batches past the orphan grace are
  swept together with their points.
*/

struct StagedBatch {
  std::string batch_id;
  std::string record_id;
  std::string collection;

  uint32_t expected_chunks = 0;

  strata::engine::v1::BatchState state = strata::engine::v1::BATCH_STATE_PENDING;

  uint64_t created_at_ms   = 0;
  uint64_t completed_at_ms = 0;
};

struct VectorMapping {
  std::string record_id;
  std::string batch_id;
  std::string collection;
  std::string point_id;

  uint32_t    dimension = 0;
  std::string model;

  uint32_t chunk_sequence = 0;
};

} // namespace strata::db::model
