#pragma once

#include <cstdint>

#include "internal/classifier/content_classifier.hpp"
#include "internal/consistency/consistency_mapper.hpp"
#include "internal/coordinator/locator_claims.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/legs/leg_store.hpp"
#include "internal/placement/placement_policy.hpp"
#include "strata/engine/v1.hpp"

namespace strata::coordinator {

struct CoordinatorOptions {
  uint64_t orphan_grace_ms = 10 * 60 * 1000;
  uint32_t preview_chars   = 2000;
};

struct SweepReport {
  uint64_t batches = 0;
  uint64_t blobs   = 0;
};

/*
  Ingestion entry point.

  Validate -> classify -> decide -> claim locator -> write legs ->
  publish through the consistency mapper. Leg failures degrade the
  record instead of failing the call; only invalid input throws before
  anything is written.
*/
class StorageCoordinator {
 public:
  StorageCoordinator(db::Repository& repo, const classifier::ContentClassifier& classifier,
                     const placement::PlacementPolicy& policy, legs::LegStore& legs, consistency::ConsistencyMapper& mapper,
                     LocatorClaims& claims, CoordinatorOptions options);

  strata::engine::v1::IngestResponse Ingest(const strata::engine::v1::IngestRequest& request);
  strata::engine::v1::IngestResponse Ingest(const strata::engine::v1::IngestRequest& request, uint64_t now_ms);

  // Removes staged batches and unowned blobs older than the orphan grace.
  SweepReport SweepOrphans(uint64_t now_ms);

 private:
  strata::engine::v1::IngestResponse Rescrape(const strata::engine::v1::IngestRequest& request, const std::string& content_hash,
                                              uint64_t now_ms);

  db::Repository&                      repo_;
  const classifier::ContentClassifier& classifier_;
  const placement::PlacementPolicy&    policy_;
  legs::LegStore&                      legs_;
  consistency::ConsistencyMapper&      mapper_;
  LocatorClaims&                       claims_;
  CoordinatorOptions                   options_;
};

} // namespace strata::coordinator
