#include "placement_policy.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "internal/model/strategy.hpp"
#include "internal/util/errors.hpp"

namespace strata::placement {

namespace {

using strata::engine::v1::ContentProfile;
using strata::engine::v1::PlacementDecision;
using strata::engine::v1::Strategy;
using strata::runtime::config::OverrideRule;
using strata::runtime::config::PolicyParameters;

constexpr double kDefaultOverrideConfidence = 0.9;

double Proximity(double distance, double margin) {
  if (margin <= 0.0) return 0.0;
  return (margin - std::min(distance, margin)) / margin;
}

double SizeProximity(uint64_t size, uint64_t threshold, double margin) {
  if (threshold == 0) return 0.0;
  const double t = static_cast<double>(threshold);
  return Proximity(std::fabs(static_cast<double>(size) - t) / t, margin);
}

double ScoreProximity(double score, double threshold, double margin) {
  return Proximity(std::fabs(score - threshold), margin);
}

// One walk through the rule chain. below_small / above_large are fixed by
// the caller so a size sitting exactly on a threshold can be tried both ways.
struct Path {
  Strategy                 strategy      = strata::engine::v1::STRATEGY_METADATA_ONLY;
  double                   max_proximity = 0.0;
  std::vector<std::string> reasoning;

  void Consult(double proximity) {
    max_proximity = std::max(max_proximity, proximity);
  }
};

bool IsHighValue(const PolicyParameters& p, const std::string& domain) {
  return std::find(p.high_value_domains().begin(), p.high_value_domains().end(), domain) != p.high_value_domains().end();
}

Path Walk(const PolicyParameters& p, uint64_t size, const ContentProfile& profile, const std::string& domain,
          bool below_small, bool above_large, const Path& prefix) {
  Path path = prefix;

  path.Consult(SizeProximity(size, p.size_small(), p.size_margin()));
  if (below_small) {
    path.strategy = strata::engine::v1::STRATEGY_FULL_STORE;
    path.reasoning.push_back(fmt::format("size {} below small threshold {}", size, p.size_small()));
    return path;
  }

  path.Consult(SizeProximity(size, p.size_large(), p.size_margin()));
  if (above_large) {
    path.strategy = strata::engine::v1::STRATEGY_VECTOR_STORE;
    path.reasoning.push_back(fmt::format("size {} above large threshold {}", size, p.size_large()));
    return path;
  }

  path.Consult(ScoreProximity(profile.semantic_complexity(), p.complexity_threshold(), p.score_margin()));
  if (profile.semantic_complexity() > p.complexity_threshold()) {
    path.Consult(ScoreProximity(profile.query_potential(), p.query_potential_threshold(), p.score_margin()));
    if (profile.query_potential() > p.query_potential_threshold()) {
      path.strategy = strata::engine::v1::STRATEGY_HYBRID;
      path.reasoning.push_back(fmt::format("complexity {:.3f} and query potential {:.3f} favour hybrid",
                                           profile.semantic_complexity(), profile.query_potential()));
      return path;
    }
  }

  if (IsHighValue(p, domain)) {
    path.Consult(SizeProximity(size, p.size_medium(), p.size_margin()));
    if (size > p.size_medium()) {
      path.strategy = strata::engine::v1::STRATEGY_HYBRID;
      path.reasoning.push_back(fmt::format("high value domain {} above medium size {}", domain, p.size_medium()));
      return path;
    }
  }

  path.strategy = strata::engine::v1::STRATEGY_METADATA_ONLY;
  path.reasoning.push_back("no storage rule matched; metadata only");
  return path;
}

enum class Match { kNo, kYes, kOnBound };

// Conditions are checked in order and stop at the first that fails; each
// checked bound counts as a consulted threshold. kOnBound means the rule
// matches only because a size bound is inclusive.
Match MatchOverride(const OverrideRule& rule, const PolicyParameters& p, uint64_t size, const ContentProfile& profile,
                    const std::string& domain, Path& path) {
  if (rule.domain() != "*" && rule.domain() != domain) return Match::kNo;

  bool on_bound = false;
  if (rule.min_size() > 0) {
    path.Consult(SizeProximity(size, rule.min_size(), p.size_margin()));
    if (size < rule.min_size()) return Match::kNo;
    on_bound = on_bound || size == rule.min_size();
  }
  if (rule.max_size() > 0) {
    path.Consult(SizeProximity(size, rule.max_size(), p.size_margin()));
    if (size > rule.max_size()) return Match::kNo;
    on_bound = on_bound || size == rule.max_size();
  }
  if (rule.min_information_density() > 0.0) {
    path.Consult(ScoreProximity(profile.information_density(), rule.min_information_density(), p.score_margin()));
    if (profile.information_density() <= rule.min_information_density()) return Match::kNo;
  }
  return on_bound ? Match::kOnBound : Match::kYes;
}

struct Outcome {
  Strategy                 strategy   = strata::engine::v1::STRATEGY_METADATA_ONLY;
  double                   confidence = 0.0;
  std::vector<std::string> reasoning;
};

// Keeps a on equal cost.
Outcome PreferCheaper(Outcome a, Outcome b, uint64_t size) {
  const bool     keep_a = model::Cheaper(a.strategy, b.strategy) == a.strategy;
  const Strategy loser  = keep_a ? b.strategy : a.strategy;
  Outcome        winner = keep_a ? std::move(a) : std::move(b);
  if (loser != winner.strategy) {
    winner.reasoning.push_back(fmt::format("size {} on threshold; {} preferred over {}", size,
                                           model::ToString(winner.strategy), model::ToString(loser)));
  }
  return winner;
}

Outcome FromPath(const PolicyParameters& p, Path path) {
  const double hi = p.max_confidence() > 0.0 ? p.max_confidence() : 0.99;
  const double lo = std::min(p.min_confidence(), hi);

  Outcome out;
  out.strategy   = path.strategy;
  out.confidence = std::clamp(1.0 - path.max_proximity, lo, hi);
  out.reasoning  = std::move(path.reasoning);
  return out;
}

Outcome WalkSides(const PolicyParameters& p, uint64_t size, const ContentProfile& profile, const std::string& domain,
                  const Path& prefix) {
  std::vector<bool> small_sides = size == p.size_small() ? std::vector<bool>{true, false}
                                                          : std::vector<bool>{size < p.size_small()};
  std::vector<bool> large_sides = size == p.size_large() ? std::vector<bool>{true, false}
                                                          : std::vector<bool>{size > p.size_large()};

  std::optional<Outcome> best;
  for (bool below : small_sides) {
    for (bool above : large_sides) {
      auto candidate = FromPath(p, Walk(p, size, profile, domain, below, above, prefix));
      best = best ? PreferCheaper(std::move(*best), std::move(candidate), size) : std::move(candidate);
    }
  }
  return std::move(*best);
}

// Overrides from `first` onward, then the size and score chain. A rule hit
// exactly on its size bound is weighed against everything after it.
Outcome Resolve(const PolicyParameters& p, uint64_t size, const ContentProfile& profile, const std::string& domain,
                int first, Path prefix) {
  for (int i = first; i < p.overrides_size(); ++i) {
    const auto& rule  = p.overrides(i);
    const Match match = MatchOverride(rule, p, size, profile, domain, prefix);
    if (match == Match::kNo) continue;

    Outcome hit;
    hit.strategy   = rule.strategy();
    hit.confidence = rule.confidence() > 0.0 ? rule.confidence() : kDefaultOverrideConfidence;
    hit.reasoning.push_back(fmt::format("override for domain {} selects {} (density {:.3f})", rule.domain(),
                                        model::ToString(rule.strategy()), profile.information_density()));
    if (match == Match::kYes) return hit;

    return PreferCheaper(std::move(hit), Resolve(p, size, profile, domain, i + 1, prefix), size);
  }
  return WalkSides(p, size, profile, domain, prefix);
}

} // namespace

PlacementPolicy::PlacementPolicy(const strata::runtime::config::PlacementConfig& config) {
  for (const auto& params : config.policies()) {
    if (params.version() == 0) {
      throw util::ValidationError("policy version must be positive");
    }
    if (!versions_.emplace(params.version(), params).second) {
      throw util::ValidationError(fmt::format("duplicate policy version {}", params.version()));
    }
    latest_ = std::max(latest_, params.version());
  }
  if (versions_.empty()) {
    throw util::ValidationError("placement config has no policy versions");
  }
}

const PolicyParameters& PlacementPolicy::Parameters(uint32_t version) const {
  const auto it = versions_.find(version);
  if (it == versions_.end()) {
    throw util::ValidationError(fmt::format("unknown policy version {}", version));
  }
  return it->second;
}

PlacementDecision PlacementPolicy::Decide(uint64_t size, const ContentProfile& profile, const std::string& domain,
                                          uint32_t version) const {
  const auto& p = Parameters(version);

  auto outcome = Resolve(p, size, profile, domain, 0, Path{});

  PlacementDecision decision;
  decision.set_policy_version(version);
  decision.set_strategy(outcome.strategy);
  decision.set_confidence(outcome.confidence);
  for (auto& r : outcome.reasoning) decision.add_reasoning(std::move(r));
  return decision;
}

} // namespace strata::placement
