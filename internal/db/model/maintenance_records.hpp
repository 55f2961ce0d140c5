#pragma once

#include <cstdint>
#include <string>

#include "strata/engine/v1.hpp"

namespace strata::db::model {

/*
  Pending repair of a degraded record.

  missing_legs is a StorageLeg bitmask. content carries the body needed
  to rewrite the legs; it is cleared once the task is resolved.
  A task that exhausts its attempts turns FATAL and stays for review.
*/
struct RepairTask {
  std::string record_id;
  unsigned    missing_legs = 0;
  std::string content;

  uint32_t attempts           = 0;
  uint64_t next_attempt_at_ms = 0;

  strata::engine::v1::RepairState state = strata::engine::v1::REPAIR_STATE_PENDING;
  std::string                     last_error;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

/*
  Superseded physical leg awaiting deferred deletion.

  ref identifies the leg: blob content hash, vector batch id, or
  dynamic table row id (with table name in collection).
*/
struct GarbageEntry {
  std::string id;
  std::string record_id;
  unsigned    leg = 0;
  std::string ref;
  std::string collection;

  uint64_t eligible_at_ms = 0;
  uint64_t created_at_ms  = 0;
};

struct Incident {
  std::string id;
  std::string record_id;
  std::string kind; // consistency_violation, repair_exhausted, ...
  std::string detail;
  uint64_t    created_at_ms = 0;
};

// Written by analysis agents; never read by placement.
struct Annotation {
  std::string record_id;
  std::string agent;
  std::string json;
  uint64_t    updated_at_ms = 0;
};

} // namespace strata::db::model
