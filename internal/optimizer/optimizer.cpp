#include "optimizer.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "internal/db/api/db_errors.hpp"
#include "internal/model/names.hpp"
#include "internal/model/strategy.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace strata::optimizer {

namespace v1 = strata::engine::v1;

using observability::IntField;
using observability::StringField;

namespace {

constexpr double kLowConfidence   = 0.7;
constexpr double kHybridShareWarn = 0.5;

v1::ContentProfile ProfileOf(const db::model::ContentRecord& r) {
  v1::ContentProfile p;
  p.set_semantic_complexity(r.semantic_complexity);
  p.set_topic_coherence(r.topic_coherence);
  p.set_information_density(r.information_density);
  p.set_query_potential(r.query_potential);
  return p;
}

} // namespace

v1::Recommendation ToProto(const db::model::RecommendationRecord& rec) {
  v1::Recommendation out;
  out.set_id(rec.id);
  out.set_type(rec.type);
  out.set_target(rec.target);
  out.set_description(rec.description);
  out.set_from_strategy(rec.from_strategy);
  out.set_to_strategy(rec.to_strategy);
  out.set_estimated_improvement_pct(rec.estimated_improvement_pct);
  out.set_confidence(rec.confidence);
  out.set_status(rec.status);
  out.set_detail(rec.detail);
  out.set_created_at_ms(rec.created_at_ms);
  out.set_updated_at_ms(rec.updated_at_ms);
  return out;
}

Optimizer::Optimizer(db::Repository& repo, const placement::PlacementPolicy& policy, schema::TableRegistry& tables,
                     migration::MigrationScheduler& migrations, OptimizerOptions options)
    : repo_(repo), policy_(policy), tables_(tables), migrations_(migrations), options_(options) {
}

db::model::RecommendationRecord Optimizer::Persist(db::model::RecommendationRecord rec, uint64_t now_ms) {
  rec.id            = util::NewId();
  rec.created_at_ms = now_ms;
  rec.updated_at_ms = now_ms;
  rec.status        = v1::RECOMMENDATION_STATUS_PENDING;

  auto tx = repo_.Begin();
  if (auto pending = repo_.FindPendingRecommendation(*tx, rec.type, rec.target)) {
    rec.status = v1::RECOMMENDATION_STATUS_REJECTED;
    rec.detail = "conflicts with pending recommendation " + pending->id;

    // one rejection per pending row is enough
    for (auto& prior : repo_.ListRecommendations(*tx, v1::RECOMMENDATION_STATUS_REJECTED)) {
      if (prior.type == rec.type && prior.target == rec.target && prior.detail == rec.detail) {
        tx->Rollback();
        return std::move(prior);
      }
    }
  }
  auto res = repo_.InsertRecommendation(*tx, rec);
  if (db::IsUniqueViolation(res) && rec.status == v1::RECOMMENDATION_STATUS_PENDING) {
    tx->Rollback();
    tx         = repo_.Begin();
    rec.status = v1::RECOMMENDATION_STATUS_REJECTED;
    rec.detail = "conflicts with a concurrent pending recommendation";
    res        = repo_.InsertRecommendation(*tx, rec);
  }
  db::ThrowIfDbError(res, "insert recommendation");
  tx->Commit();

  if (rec.status == v1::RECOMMENDATION_STATUS_REJECTED) {
    STRATA_LOG_DEBUG("recommendation conflict", {StringField("type", model::ToString(rec.type)), StringField("target", rec.target)});
  } else {
    STRATA_LOG_INFO("recommendation emitted", {StringField("id", rec.id), StringField("type", model::ToString(rec.type)),
                                               StringField("target", rec.target)});
  }
  return rec;
}

std::vector<db::model::RecommendationRecord> Optimizer::Evaluate(uint64_t now_ms) {
  const uint64_t since = now_ms > options_.window_ms ? now_ms - options_.window_ms : 0;

  std::vector<db::model::PerformanceSample> samples;
  uint64_t                                  stale_records = 0;
  {
    auto tx = repo_.Begin();
    samples = repo_.ListSamples(*tx, since);

    db::model::RecordFilter stale;
    stale.policy_version_below = policy_.LatestVersion();
    stale_records              = repo_.CountRecords(*tx, stale);
    tx->Rollback();
  }

  struct DomainStats {
    uint64_t                         count   = 0;
    double                           latency = 0.0;
    std::map<v1::Strategy, uint64_t> strategies;
  };
  std::map<std::string, DomainStats> domains;
  for (const auto& s : samples) {
    if (s.domain.empty()) continue;
    auto& d = domains[s.domain];
    d.count += 1;
    d.latency += s.latency_ms;
    d.strategies[s.strategy] += 1;
  }

  std::vector<db::model::RecommendationRecord> out;
  for (const auto& [domain, d] : domains) {
    if (d.count < options_.min_samples) continue;
    const double mean = d.latency / static_cast<double>(d.count);
    if (mean <= options_.latency_threshold_ms) continue;

    db::model::RecommendationRecord index;
    index.type        = v1::RECOMMENDATION_TYPE_ADD_INDEX;
    index.target      = domain;
    index.description = fmt::format("add index for domain {}: mean latency {:.1f} ms over {} queries", domain, mean, d.count);
    index.estimated_improvement_pct = std::min(60.0, 100.0 * (1.0 - options_.latency_threshold_ms / mean));
    index.confidence =
        0.5 + 0.45 * std::min(1.0, static_cast<double>(d.count) / (4.0 * std::max<uint32_t>(1, options_.min_samples)));
    out.push_back(Persist(std::move(index), now_ms));

    uint64_t     non_hybrid = 0;
    v1::Strategy dominant   = v1::STRATEGY_UNSPECIFIED;
    uint64_t     dominant_n = 0;
    for (const auto& [strategy, n] : d.strategies) {
      if (strategy == v1::STRATEGY_HYBRID || strategy == v1::STRATEGY_UNSPECIFIED) continue;
      non_hybrid += n;
      if (n > dominant_n) {
        dominant   = strategy;
        dominant_n = n;
      }
    }
    const double share = static_cast<double>(non_hybrid) / static_cast<double>(d.count);
    if (share > 0.5) {
      db::model::RecommendationRecord migrate;
      migrate.type          = v1::RECOMMENDATION_TYPE_MIGRATE_STRATEGY;
      migrate.target        = domain;
      migrate.from_strategy = dominant;
      migrate.to_strategy   = v1::STRATEGY_HYBRID;
      migrate.description   = fmt::format("migrate domain {} toward hybrid: {:.0f}% of slow queries hit {} records", domain,
                                          share * 100.0, model::ToString(dominant));
      migrate.estimated_improvement_pct = 40.0 * share;
      migrate.confidence                = 0.3 + 0.6 * share;
      out.push_back(Persist(std::move(migrate), now_ms));
    }
  }

  if (stale_records > 0) {
    db::model::RecommendationRecord stale;
    stale.type        = v1::RECOMMENDATION_TYPE_STALE_POLICY;
    stale.target      = fmt::format("policy_v{}", policy_.LatestVersion());
    stale.description = fmt::format("{} records placed under a policy older than v{}", stale_records, policy_.LatestVersion());
    stale.estimated_improvement_pct = 10.0;
    stale.confidence                = 0.7;
    out.push_back(Persist(std::move(stale), now_ms));
  }

  const auto tables = tables_.DynamicTableCount();
  if (tables > options_.max_dynamic_tables) {
    db::model::RecommendationRecord consolidate;
    consolidate.type        = v1::RECOMMENDATION_TYPE_CONSOLIDATE_TABLES;
    consolidate.target      = "dynamic_tables";
    consolidate.description = fmt::format("{} dynamic tables exceed the limit of {}", tables, options_.max_dynamic_tables);
    consolidate.from_strategy             = v1::STRATEGY_SPECIALIZED_TABLE;
    consolidate.to_strategy               = v1::STRATEGY_FULL_STORE;
    consolidate.estimated_improvement_pct = 15.0;
    consolidate.confidence                = 0.6;
    out.push_back(Persist(std::move(consolidate), now_ms));
  }

  STRATA_LOG_INFO("optimizer evaluated", {IntField("samples", static_cast<int64_t>(samples.size())),
                                          IntField("recommendations", static_cast<int64_t>(out.size()))});
  return out;
}

uint64_t Optimizer::ExpireStale(uint64_t now_ms) {
  if (now_ms <= options_.recommendation_ttl_ms) return 0;
  const uint64_t cutoff = now_ms - options_.recommendation_ttl_ms;

  auto tx = repo_.Begin();

  // terminal rows that nobody acts on age out after the same ttl
  for (auto status : {v1::RECOMMENDATION_STATUS_REJECTED, v1::RECOMMENDATION_STATUS_EXPIRED}) {
    db::ThrowIfDbError(repo_.DeleteRecommendationsBefore(*tx, status, cutoff), "purge recommendations");
  }

  uint64_t expired = 0;
  for (auto& rec : repo_.ListRecommendations(*tx, v1::RECOMMENDATION_STATUS_PENDING)) {
    if (rec.created_at_ms >= cutoff) continue;
    rec.status        = v1::RECOMMENDATION_STATUS_EXPIRED;
    rec.detail        = "not applied within ttl";
    rec.updated_at_ms = now_ms;
    db::ThrowIfDbError(repo_.UpdateRecommendation(*tx, rec), "expire recommendation");
    ++expired;
  }
  tx->Commit();
  return expired;
}

Optimizer::Plan Optimizer::PlanMigrations(const db::model::RecommendationRecord& rec) {
  Plan plan;
  auto tx = repo_.Begin();

  switch (rec.type) {
    case v1::RECOMMENDATION_TYPE_MIGRATE_STRATEGY: {
      db::model::RecordFilter f;
      f.domain = rec.target;
      f.status = v1::RECORD_STATUS_READY;
      for (const auto& r : repo_.ListRecords(*tx, f)) {
        if (r.strategy == rec.to_strategy) continue;
        if (model::LegsFor(r.strategy) == 0) {
          ++plan.skipped;
          continue;
        }
        plan.moves.emplace_back(r.id, rec.to_strategy);
      }
      break;
    }
    case v1::RECOMMENDATION_TYPE_STALE_POLICY: {
      const auto              latest = policy_.LatestVersion();
      db::model::RecordFilter f;
      f.policy_version_below = latest;
      f.status               = v1::RECORD_STATUS_READY;
      for (const auto& r : repo_.ListRecords(*tx, f)) {
        const auto decision = policy_.Decide(r.declared_size, ProfileOf(r), r.domain, latest);
        if (model::LegsFor(r.strategy) == 0 && decision.strategy() != r.strategy) {
          ++plan.skipped;
          continue;
        }
        plan.moves.emplace_back(r.id, decision.strategy());
      }
      break;
    }
    case v1::RECOMMENDATION_TYPE_CONSOLIDATE_TABLES: {
      std::vector<db::model::TableDescriptor> live;
      for (auto& d : repo_.ListTableDescriptors(*tx)) {
        if (!d.columns.empty() && d.row_count > 0) live.push_back(std::move(d));
      }
      if (live.size() <= options_.max_dynamic_tables) break;

      // fold the least used tables first
      std::sort(live.begin(), live.end(), [](const auto& a, const auto& b) {
        if (a.row_count != b.row_count) return a.row_count < b.row_count;
        return a.name < b.name;
      });
      const std::size_t excess = live.size() - options_.max_dynamic_tables;
      for (std::size_t i = 0; i < excess; ++i) {
        db::model::RecordFilter f;
        f.table_name = live[i].name;
        f.status     = v1::RECORD_STATUS_READY;
        for (const auto& r : repo_.ListRecords(*tx, f)) plan.moves.emplace_back(r.id, v1::STRATEGY_FULL_STORE);
      }
      break;
    }
    default:
      break;
  }
  tx->Rollback();
  return plan;
}

v1::ApplyRecommendationResponse Optimizer::Apply(const std::string& id, uint64_t now_ms) {
  db::model::RecommendationRecord rec;
  {
    auto tx    = repo_.Begin();
    auto found = repo_.GetRecommendation(*tx, id);
    tx->Rollback();
    if (!found) throw util::NotFound("recommendation " + id);
    rec = std::move(*found);
  }
  if (rec.status != v1::RECOMMENDATION_STATUS_PENDING) {
    throw util::InvalidState("recommendation " + id + " is " + std::string(model::ToString(rec.status)));
  }

  v1::ApplyRecommendationResponse response;
  bool                            ok = true;

  if (rec.type == v1::RECOMMENDATION_TYPE_ADD_INDEX) {
    try {
      const auto applied = tables_.Apply(tables_.Builder().ForDomainIndex(rec.target, now_ms), now_ms);
      response.set_detail("index " + applied.name + " v" + std::to_string(applied.version));
    } catch (const std::exception& e) {
      ok = false;
      response.set_detail(e.what());
    }
  } else {
    const auto plan = PlanMigrations(rec);

    std::vector<migration::Submission> submissions;
    for (const auto& [record_id, target] : plan.moves) {
      submissions.push_back(migrations_.Submit(record_id, target, policy_.LatestVersion()));
    }

    uint32_t    succeeded = 0;
    std::string first_error;
    for (auto& s : submissions) {
      const auto result = s.result.get();
      if (result.outcome == migration::Outcome::kSucceeded || result.outcome == migration::Outcome::kUnchanged) {
        ++succeeded;
      } else if (first_error.empty()) {
        first_error = result.record_id + ": " + (result.error.empty() ? migration::ToString(result.outcome) : result.error);
      }
    }

    response.set_migrations_submitted(static_cast<uint32_t>(submissions.size()));
    response.set_migrations_succeeded(succeeded);
    response.set_migrations_skipped(plan.skipped);
    ok = succeeded == submissions.size();
    response.set_detail(ok ? fmt::format("{} migrations completed", succeeded) : first_error);
  }

  rec.status        = ok ? v1::RECOMMENDATION_STATUS_APPLIED : v1::RECOMMENDATION_STATUS_FAILED;
  rec.detail        = response.detail();
  rec.updated_at_ms = now_ms;
  {
    auto tx = repo_.Begin();
    db::ThrowIfDbError(repo_.UpdateRecommendation(*tx, rec), "update recommendation");
    tx->Commit();
  }

  response.set_status(rec.status);
  STRATA_LOG_INFO("recommendation applied", {StringField("id", rec.id), StringField("type", model::ToString(rec.type)),
                                             StringField("status", model::ToString(rec.status)),
                                             StringField("detail", rec.detail)});
  return response;
}

std::vector<db::model::RecommendationRecord> Optimizer::List(v1::RecommendationStatus status) {
  auto tx  = repo_.Begin();
  auto out = repo_.ListRecommendations(*tx, status);
  tx->Rollback();
  return out;
}

v1::StorageAnalytics Optimizer::Analytics() {
  std::vector<db::model::ContentRecord> records;
  {
    auto tx = repo_.Begin();
    records = repo_.ListRecords(*tx, db::model::RecordFilter{});
    tx->Rollback();
  }

  struct Group {
    uint64_t count      = 0;
    double   size       = 0.0;
    double   queries    = 0.0;
    double   complexity = 0.0;
    double   confidence = 0.0;
  };
  std::map<std::pair<std::string, v1::Strategy>, Group> groups;
  std::map<std::string, uint64_t>                       distribution;
  double                                                confidence_sum = 0.0;
  uint64_t                                              hybrid         = 0;

  for (const auto& r : records) {
    auto& g = groups[{r.domain, r.strategy}];
    g.count += 1;
    g.size += static_cast<double>(r.declared_size);
    g.queries += static_cast<double>(r.query_count);
    g.complexity += r.semantic_complexity;
    g.confidence += r.confidence;

    distribution[std::string(model::ToString(r.strategy))] += 1;
    confidence_sum += r.confidence;
    if (r.strategy == v1::STRATEGY_HYBRID) ++hybrid;
  }

  v1::StorageAnalytics out;
  for (const auto& [key, g] : groups) {
    const double n = static_cast<double>(g.count);
    auto*        o = out.add_overview();
    o->set_domain(key.first);
    o->set_strategy(key.second);
    o->set_count(g.count);
    o->set_avg_size(g.size / n);
    o->set_avg_query_count(g.queries / n);
    o->set_avg_complexity(g.complexity / n);
    o->set_avg_confidence(g.confidence / n);
  }
  for (const auto& [name, n] : distribution) (*out.mutable_decision_distribution())[name] = n;

  const auto tables = tables_.DynamicTableCount();
  out.set_dynamic_tables(tables);

  if (!records.empty()) {
    const double avg = confidence_sum / static_cast<double>(records.size());
    out.set_average_confidence(avg);
    if (avg < kLowConfidence) {
      out.add_insights(fmt::format("average placement confidence {:.2f} is low; review policy thresholds", avg));
    }
    const double hybrid_share = static_cast<double>(hybrid) / static_cast<double>(records.size());
    if (hybrid_share > kHybridShareWarn) {
      out.add_insights(fmt::format("{:.0f}% of records are hybrid; review synchronization cost", hybrid_share * 100.0));
    }
  }
  if (tables > options_.max_dynamic_tables) {
    out.add_insights(fmt::format("{} dynamic tables exceed {}; consider consolidation", tables, options_.max_dynamic_tables));
  }
  return out;
}

} // namespace strata::optimizer
