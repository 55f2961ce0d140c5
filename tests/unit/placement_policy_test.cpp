#include "internal/placement/placement_policy.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "support/test_support.hpp"

namespace {

namespace v1 = strata::engine::v1;

using strata::placement::PlacementPolicy;

constexpr uint64_t kKiB = 1024;
constexpr uint64_t kMiB = 1024 * kKiB;

v1::ContentProfile Profile(double complexity, double query_potential, double density) {
  v1::ContentProfile p;
  p.set_semantic_complexity(complexity);
  p.set_topic_coherence(0.3);
  p.set_information_density(density);
  p.set_query_potential(query_potential);
  return p;
}

PlacementPolicy DefaultPolicy() {
  return PlacementPolicy(strata::testing::DefaultConfig().placement());
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

bool HasReason(const v1::PlacementDecision& d, const std::string& needle) {
  for (const auto& r : d.reasoning()) {
    if (r.find(needle) != std::string::npos) return true;
  }
  return false;
}

void TestSmallContentGoesToFullStore() {
  const auto policy = DefaultPolicy();
  const auto d      = policy.Decide(10 * kKiB, Profile(0.4, 0.5, 0.3), "technology");
  assert(d.strategy() == v1::STRATEGY_FULL_STORE);
  assert(d.policy_version() == 1);
  // far from every consulted threshold
  assert(Near(d.confidence(), 0.99));
  assert(!d.reasoning().empty());
}

void TestHugeContentGoesToVectorStore() {
  const auto policy = DefaultPolicy();
  const auto d      = policy.Decide(200 * kMiB, Profile(0.4, 0.5, 0.3), "general");
  assert(d.strategy() == v1::STRATEGY_VECTOR_STORE);
}

void TestComplexQueryableContentIsHybrid() {
  const auto policy = DefaultPolicy();
  const auto d      = policy.Decide(200 * kKiB, Profile(0.95, 0.95, 0.5), "general");
  assert(d.strategy() == v1::STRATEGY_HYBRID);
  // query potential sits 0.15 above its threshold: proximity 0.25
  assert(Near(d.confidence(), 0.75));
}

void TestScoresExactlyOnThresholdDoNotFire() {
  const auto policy = DefaultPolicy();
  const auto d      = policy.Decide(200 * kKiB, Profile(0.7, 0.95, 0.5), "general");
  assert(d.strategy() == v1::STRATEGY_METADATA_ONLY);
}

void TestHighValueDomainAboveMediumIsHybrid() {
  const auto policy = DefaultPolicy();
  assert(policy.Decide(2 * kMiB, Profile(0.4, 0.5, 0.3), "science").strategy() == v1::STRATEGY_HYBRID);
  assert(policy.Decide(2 * kMiB, Profile(0.4, 0.5, 0.3), "general").strategy() == v1::STRATEGY_METADATA_ONLY);
  assert(policy.Decide(512 * kKiB, Profile(0.4, 0.5, 0.3), "science").strategy() == v1::STRATEGY_METADATA_ONLY);
}

void TestDenseMidSizedContentGetsSpecializedTable() {
  const auto policy = DefaultPolicy();
  const auto d      = policy.Decide(100 * kKiB, Profile(0.4, 0.5, 0.95), "history");
  assert(d.strategy() == v1::STRATEGY_SPECIALIZED_TABLE);
  assert(Near(d.confidence(), 0.8));
  assert(HasReason(d, "override"));

  // outside the override size range the normal chain applies
  assert(policy.Decide(10 * kKiB, Profile(0.4, 0.5, 0.95), "history").strategy() == v1::STRATEGY_FULL_STORE);
}

void TestSmallThresholdTiePicksCheaperSide() {
  const auto policy = DefaultPolicy();
  const auto d      = policy.Decide(50 * kKiB, Profile(0.4, 0.5, 0.3), "general");
  // FULL_STORE below, METADATA_ONLY above: the cheaper wins
  assert(d.strategy() == v1::STRATEGY_METADATA_ONLY);
  assert(HasReason(d, "on threshold"));
  assert(Near(d.confidence(), 0.3));
}

void TestLargeThresholdTiePicksCheaperSide() {
  const auto policy = DefaultPolicy();
  // VECTOR_STORE above, HYBRID (high value domain) below
  assert(policy.Decide(50 * kMiB, Profile(0.4, 0.5, 0.3), "science").strategy() == v1::STRATEGY_VECTOR_STORE);
  // VECTOR_STORE above, METADATA_ONLY below
  assert(policy.Decide(50 * kMiB, Profile(0.4, 0.5, 0.3), "general").strategy() == v1::STRATEGY_METADATA_ONLY);
}

void TestDenseContentOnOverrideBoundPicksCheaperSide() {
  const auto policy  = DefaultPolicy();
  const auto profile = Profile(0.4, 0.5, 0.9);

  assert(policy.Decide(50 * kKiB - 1, profile, "technology").strategy() == v1::STRATEGY_FULL_STORE);
  assert(policy.Decide(50 * kKiB + 1, profile, "technology").strategy() == v1::STRATEGY_SPECIALIZED_TABLE);

  // the override's lower bound sits on SIZE_SMALL: SPECIALIZED_TABLE against
  // the small threshold tie, which itself resolves to METADATA_ONLY
  const auto at_small = policy.Decide(50 * kKiB, profile, "technology");
  assert(at_small.strategy() == v1::STRATEGY_METADATA_ONLY);
  assert(HasReason(at_small, "preferred over specialized_table"));

  // upper bound sits on SIZE_LARGE
  const auto at_large = policy.Decide(50 * kMiB, profile, "technology");
  assert(at_large.strategy() == v1::STRATEGY_METADATA_ONLY);
  assert(HasReason(at_large, "preferred over specialized_table"));
  assert(policy.Decide(50 * kMiB - 1, profile, "technology").strategy() == v1::STRATEGY_SPECIALIZED_TABLE);
}

void TestOverrideOnBoundWinsWhenCheaper() {
  auto  config = strata::testing::DefaultConfig();
  auto* params = config.mutable_placement()->mutable_policies(0);
  params->clear_overrides();
  auto* rule = params->add_overrides();
  rule->set_domain("science");
  rule->set_strategy(v1::STRATEGY_FULL_STORE);
  rule->set_min_size(2 * kMiB);
  rule->set_confidence(0.85);

  const PlacementPolicy policy(config.placement());
  const auto            profile = Profile(0.4, 0.5, 0.3);

  // without the rule a science item above SIZE_MEDIUM is HYBRID
  const auto d = policy.Decide(2 * kMiB, profile, "science");
  assert(d.strategy() == v1::STRATEGY_FULL_STORE);
  assert(Near(d.confidence(), 0.85));
  assert(HasReason(d, "preferred over hybrid"));

  assert(policy.Decide(2 * kMiB - 1, profile, "science").strategy() == v1::STRATEGY_HYBRID);
}

void TestDecideIsDeterministic() {
  const auto policy  = DefaultPolicy();
  const auto profile = Profile(0.72, 0.81, 0.4);
  const auto a       = policy.Decide(3 * kMiB, profile, "philosophy");
  const auto b       = policy.Decide(3 * kMiB, profile, "philosophy");
  assert(a.SerializeAsString() == b.SerializeAsString());
}

void TestEveryConfiguredVersionStaysDecidable() {
  auto config = strata::testing::DefaultConfig();
  auto* v2    = config.mutable_placement()->add_policies();
  *v2         = config.placement().policies(0);
  v2->set_version(2);
  v2->set_size_small(100 * kKiB);

  const PlacementPolicy policy(config.placement());
  assert(policy.LatestVersion() == 2);

  const auto profile = Profile(0.4, 0.5, 0.3);
  const auto old_d   = policy.Decide(80 * kKiB, profile, "general", 1);
  const auto new_d   = policy.Decide(80 * kKiB, profile, "general");
  assert(old_d.strategy() == v1::STRATEGY_METADATA_ONLY);
  assert(old_d.policy_version() == 1);
  assert(new_d.strategy() == v1::STRATEGY_FULL_STORE);
  assert(new_d.policy_version() == 2);
}

void TestUnknownOrDuplicateVersionsAreRejected() {
  const auto policy = DefaultPolicy();
  bool       threw  = false;
  try {
    (void)policy.Decide(10 * kKiB, Profile(0.4, 0.5, 0.3), "general", 9);
  } catch (const strata::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  auto config = strata::testing::DefaultConfig();
  *config.mutable_placement()->add_policies() = config.placement().policies(0);
  threw = false;
  try {
    PlacementPolicy duplicate(config.placement());
  } catch (const strata::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    PlacementPolicy empty(strata::runtime::config::PlacementConfig{});
  } catch (const strata::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSmallContentGoesToFullStore();
  TestHugeContentGoesToVectorStore();
  TestComplexQueryableContentIsHybrid();
  TestScoresExactlyOnThresholdDoNotFire();
  TestHighValueDomainAboveMediumIsHybrid();
  TestDenseMidSizedContentGetsSpecializedTable();
  TestSmallThresholdTiePicksCheaperSide();
  TestLargeThresholdTiePicksCheaperSide();
  TestDenseContentOnOverrideBoundPicksCheaperSide();
  TestOverrideOnBoundWinsWhenCheaper();
  TestDecideIsDeterministic();
  TestEveryConfiguredVersionStaysDecidable();
  TestUnknownOrDuplicateVersionsAreRejected();

  std::cout << "strata_unit_placement_policy: pass\n";
  return 0;
}
