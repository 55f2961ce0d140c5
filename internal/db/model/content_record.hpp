#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "strata/engine/v1.hpp"

namespace strata::db::model {

/*
  Persistent content record.

  IMPORTANT:
  - Exactly one row per source_locator (unique key).
  - Location columns are written only through the consistency mapper.
  - version is bumped on every full update and checked by UpdateRecord
    for optimistic concurrency. Access stats are updated out of band
    without a version bump.
*/

struct ContentRecord {
  std::string id;
  std::string source_locator;

  std::string title;
  std::string author;
  std::string domain;
  std::string content_type;

  uint64_t    declared_size = 0;
  uint64_t    text_size     = 0;
  std::string content_hash;

  // profile scores, each in [0,1]
  double semantic_complexity = 0.0;
  double topic_coherence     = 0.0;
  double information_density = 0.0;
  double query_potential     = 0.0;

  strata::engine::v1::Strategy strategy       = strata::engine::v1::STRATEGY_UNSPECIFIED;
  uint32_t                     policy_version = 0;
  double                       confidence     = 0.0;
  std::vector<std::string>     reasoning;

  strata::engine::v1::RecordStatus status       = strata::engine::v1::RECORD_STATUS_UNSPECIFIED;
  bool                             needs_review = false;

  // location pointer; empty strings mean the leg is absent
  std::string blob_hash;
  std::string vector_batch_id;
  std::string vector_collection;
  uint32_t    chunk_count = 0;
  std::string table_name;
  std::string table_row_id;

  // searchable prefix of the body (title + preview are full-text indexed)
  std::string              preview;
  std::string              metadata_json;
  std::vector<std::string> tags;

  // access stats (relaxed)
  uint64_t query_count        = 0;
  uint64_t last_queried_at_ms = 0;
  double   access_frequency   = 0.0;

  uint64_t scrape_count  = 1;
  uint64_t version       = 1;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

/*
  Filter pushed down into record scans and full-text search.
  Empty strings and zero bounds mean "no constraint".
*/
struct RecordFilter {
  std::string domain;
  std::string content_type;
  uint64_t    created_after_ms  = 0;
  uint64_t    created_before_ms = 0;

  strata::engine::v1::Strategy     strategy = strata::engine::v1::STRATEGY_UNSPECIFIED;
  strata::engine::v1::RecordStatus status   = strata::engine::v1::RECORD_STATUS_UNSPECIFIED;

  // records placed under a policy older than this (0 = no constraint)
  uint32_t policy_version_below = 0;

  std::string table_name;

  bool needs_review_only = false;
};

struct TextHit {
  std::string record_id;
  double      rank = 0.0; // higher is better
};

} // namespace strata::db::model
