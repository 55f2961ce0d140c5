#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "config/config.pb.h"
#include "strata/engine/v1.hpp"

namespace strata::placement {

/*
  Versioned placement rules.

  Decide is a pure function of its arguments and the parameter table
  captured at construction. Every configured version stays decidable so
  the optimizer can compare a record's stored decision against the
  current one; new ingests use LatestVersion().
*/
class PlacementPolicy {
 public:
  explicit PlacementPolicy(const strata::runtime::config::PlacementConfig& config);

  // ValidationError when the version is not configured.
  strata::engine::v1::PlacementDecision Decide(uint64_t size, const strata::engine::v1::ContentProfile& profile,
                                               const std::string& domain, uint32_t version) const;

  strata::engine::v1::PlacementDecision Decide(uint64_t size, const strata::engine::v1::ContentProfile& profile,
                                               const std::string& domain) const {
    return Decide(size, profile, domain, LatestVersion());
  }

  uint32_t LatestVersion() const {
    return latest_;
  }

  const strata::runtime::config::PolicyParameters& Parameters(uint32_t version) const;

 private:
  std::map<uint32_t, strata::runtime::config::PolicyParameters> versions_;
  uint32_t                                                      latest_ = 0;
};

} // namespace strata::placement
