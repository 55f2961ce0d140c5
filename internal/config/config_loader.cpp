#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace strata::config {

using google::protobuf::util::TimeUtil;
using namespace strata::runtime::config;

namespace {

constexpr uint64_t kKiB = 1024;
constexpr uint64_t kMiB = 1024 * kKiB;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  // an empty document is an all-defaults config
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ValidationError("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

void DefaultDuration(google::protobuf::Duration* duration, int64_t ms) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    *duration = TimeUtil::MillisecondsToDuration(ms);
  }
}

void DefaultRetry(RetryConfig* retry) {
  if (retry->max_attempts() == 0) retry->set_max_attempts(3);
  if (retry->multiplier() == 0.0) retry->set_multiplier(2.0);
  DefaultDuration(retry->mutable_initial_backoff(), 50);
  DefaultDuration(retry->mutable_max_backoff(), 2000);
}

void DefaultPolicy(PolicyParameters* p) {
  if (p->size_small() == 0) p->set_size_small(50 * kKiB);
  if (p->size_medium() == 0) p->set_size_medium(1 * kMiB);
  if (p->size_large() == 0) p->set_size_large(50 * kMiB);
  if (p->complexity_threshold() == 0.0) p->set_complexity_threshold(0.7);
  if (p->query_potential_threshold() == 0.0) p->set_query_potential_threshold(0.8);
  if (p->size_margin() == 0.0) p->set_size_margin(0.5);
  if (p->score_margin() == 0.0) p->set_score_margin(0.2);
  if (p->min_confidence() == 0.0) p->set_min_confidence(0.3);
  if (p->max_confidence() == 0.0) p->set_max_confidence(0.99);
  for (auto& rule : *p->mutable_overrides()) {
    if (rule.confidence() == 0.0) rule.set_confidence(0.9);
  }
}

} // namespace

uint64_t DurationMs(const google::protobuf::Duration& duration) {
  const auto ms = TimeUtil::DurationToMilliseconds(duration);
  return ms > 0 ? static_cast<uint64_t>(ms) : 0;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);
  ApplyEnvOverrides(config);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::ValidationError("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);
  ApplyEnvOverrides(config);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyEnvOverrides(RuntimeConfig& config) {
  if (const char* path = std::getenv("STRATA_DB_PATH"); path && *path) {
    config.mutable_database()->mutable_sqlite()->set_path(path);
  }
  if (const char* path = std::getenv("STRATA_VECTOR_PATH"); path && *path) {
    config.mutable_vector_store()->mutable_sqlite()->set_path(path);
  }
  if (const char* alpha = std::getenv("STRATA_QUERY_ALPHA"); alpha && *alpha) {
    char*        end   = nullptr;
    const double value = std::strtod(alpha, &end);
    if (!end || *end != '\0') {
      throw util::ValidationError(fmt::format("STRATA_QUERY_ALPHA is not a number: {}", alpha));
    }
    config.mutable_query()->set_alpha(value);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("strata-engine");

  auto* database = config.mutable_database();
  if (database->backend_case() == DatabaseConfig::BACKEND_NOT_SET) database->mutable_memory();
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(16);
  }

  auto* vectors = config.mutable_vector_store();
  if (vectors->backend_case() == VectorStoreConfig::BACKEND_NOT_SET) vectors->mutable_memory();
  if (vectors->collection_prefix().empty()) vectors->set_collection_prefix("strata");

  auto* embedding = config.mutable_embedding();
  if (embedding->dimension() == 0) embedding->set_dimension(384);
  if (embedding->model().empty()) embedding->set_model("hashing-v1");

  auto* classifier = config.mutable_classifier();
  if (classifier->domain_priors_size() == 0) {
    for (const char* domain : {"literature", "philosophy", "science"}) {
      auto* prior = classifier->add_domain_priors();
      prior->set_domain(domain);
      prior->set_query_prior(1.0);
    }
  }
  if (classifier->content_type_priors_size() == 0) {
    const std::pair<const char*, double> kTypePriors[] = {
        {"academic_paper", 0.9}, {"reference", 0.8},       {"book", 0.7},
        {"large_document", 0.6}, {"medium_document", 0.5}, {"small_document", 0.4},
    };
    for (const auto& [type, value] : kTypePriors) {
      auto* prior = classifier->add_content_type_priors();
      prior->set_content_type(type);
      prior->set_access_prior(value);
    }
  }
  if (classifier->default_domain_prior() == 0.0) classifier->set_default_domain_prior(0.5);
  if (classifier->default_content_type_prior() == 0.0) classifier->set_default_content_type_prior(0.5);

  auto* placement = config.mutable_placement();
  if (placement->policies_size() == 0) {
    auto* policy = placement->add_policies();
    policy->set_version(1);
    for (const char* domain : {"science", "philosophy", "literature"}) policy->add_high_value_domains(domain);

    auto* dense = policy->add_overrides();
    dense->set_domain("*");
    dense->set_strategy(strata::engine::core::v1::STRATEGY_SPECIALIZED_TABLE);
    dense->set_min_size(50 * kKiB);
    dense->set_max_size(50 * kMiB);
    dense->set_min_information_density(0.8);
    dense->set_confidence(0.8);
  }
  for (auto& policy : *placement->mutable_policies()) DefaultPolicy(&policy);

  auto* coordinator = config.mutable_coordinator();
  if (coordinator->chunk_size() == 0) coordinator->set_chunk_size(1000);
  if (coordinator->chunk_overlap() == 0) coordinator->set_chunk_overlap(200);
  if (coordinator->vector_workers() == 0) coordinator->set_vector_workers(4);
  if (coordinator->preview_chars() == 0) coordinator->set_preview_chars(2000);
  if (coordinator->table_prefix().empty()) coordinator->set_table_prefix("dyn");
  DefaultRetry(coordinator->mutable_transient_retry());
  DefaultDuration(coordinator->mutable_orphan_grace(), 10 * 60 * 1000);

  DefaultDuration(config.mutable_consistency()->mutable_gc_grace(), 10 * 60 * 1000);

  auto* query = config.mutable_query();
  if (!query->has_alpha()) query->set_alpha(0.5);
  if (query->vector_top_k() == 0) query->set_vector_top_k(50);
  if (query->workers() == 0) query->set_workers(4);
  if (query->default_limit() == 0) query->set_default_limit(10);
  DefaultDuration(query->mutable_subquery_timeout(), 2000);
  DefaultDuration(query->mutable_default_deadline(), 5000);

  auto* optimizer = config.mutable_optimizer();
  if (optimizer->min_samples() == 0) optimizer->set_min_samples(10);
  if (optimizer->latency_threshold_ms() == 0.0) optimizer->set_latency_threshold_ms(500.0);
  if (optimizer->max_dynamic_tables() == 0) optimizer->set_max_dynamic_tables(50);
  if (optimizer->max_buffered_samples() == 0) optimizer->set_max_buffered_samples(10000);
  DefaultDuration(optimizer->mutable_window(), 24LL * 3600 * 1000);
  DefaultDuration(optimizer->mutable_recommendation_ttl(), 7LL * 24 * 3600 * 1000);
  DefaultDuration(optimizer->mutable_sample_retention(), 30LL * 24 * 3600 * 1000);
  DefaultDuration(optimizer->mutable_evaluate_interval(), 15LL * 60 * 1000);
  DefaultDuration(optimizer->mutable_flush_interval(), 1000);

  auto* reconciliation = config.mutable_reconciliation();
  if (reconciliation->max_attempts() == 0) reconciliation->set_max_attempts(3);
  DefaultDuration(reconciliation->mutable_initial_backoff(), 1000);
  DefaultDuration(reconciliation->mutable_max_backoff(), 60 * 1000);
  DefaultDuration(reconciliation->mutable_interval(), 5000);

  auto* migration = config.mutable_migration();
  if (migration->workers() == 0) migration->set_workers(2);
  if (migration->max_per_second() == 0.0) migration->set_max_per_second(5.0);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& query = config.query();
  if (query.alpha() < 0.0 || query.alpha() > 1.0) {
    throw util::ValidationError(fmt::format("query.alpha must be within [0,1], got {}", query.alpha()));
  }
  if (query.min_vector_similarity() < -1.0 || query.min_vector_similarity() > 1.0) {
    throw util::ValidationError("query.min_vector_similarity must be within [-1,1]");
  }
  if (query.workers() == 0 || query.vector_top_k() == 0 || query.default_limit() == 0) {
    throw util::ValidationError("query.workers, query.vector_top_k and query.default_limit must be positive");
  }

  const auto& coordinator = config.coordinator();
  if (coordinator.chunk_size() == 0 || coordinator.chunk_overlap() >= coordinator.chunk_size()) {
    throw util::ValidationError(fmt::format("coordinator.chunk_overlap ({}) must be smaller than chunk_size ({})",
                                            coordinator.chunk_overlap(), coordinator.chunk_size()));
  }
  if (coordinator.vector_workers() == 0) {
    throw util::ValidationError("coordinator.vector_workers must be positive");
  }
  if (coordinator.transient_retry().max_attempts() == 0 || coordinator.transient_retry().multiplier() < 1.0) {
    throw util::ValidationError("coordinator.transient_retry needs max_attempts > 0 and multiplier >= 1");
  }

  if (config.embedding().dimension() == 0) {
    throw util::ValidationError("embedding.dimension must be positive");
  }

  if (config.placement().policies_size() == 0) {
    throw util::ValidationError("placement.policies must not be empty");
  }
  std::set<uint32_t> versions;
  for (const auto& p : config.placement().policies()) {
    if (p.version() == 0 || !versions.insert(p.version()).second) {
      throw util::ValidationError(fmt::format("placement policy version {} is zero or duplicated", p.version()));
    }
    if (!(p.size_small() < p.size_medium() && p.size_medium() < p.size_large())) {
      throw util::ValidationError(fmt::format("policy v{}: size thresholds must satisfy small < medium < large", p.version()));
    }
    if (p.size_margin() <= 0.0 || p.score_margin() <= 0.0) {
      throw util::ValidationError(fmt::format("policy v{}: margins must be positive", p.version()));
    }
    if (p.min_confidence() < 0.0 || p.max_confidence() > 1.0 || p.min_confidence() > p.max_confidence()) {
      throw util::ValidationError(fmt::format("policy v{}: confidence bounds must satisfy 0 <= min <= max <= 1", p.version()));
    }
    for (const auto& rule : p.overrides()) {
      if (rule.domain().empty() || rule.strategy() == strata::engine::core::v1::STRATEGY_UNSPECIFIED) {
        throw util::ValidationError(fmt::format("policy v{}: override rules need a domain and a strategy", p.version()));
      }
      if (rule.max_size() != 0 && rule.min_size() > rule.max_size()) {
        throw util::ValidationError(fmt::format("policy v{}: override min_size exceeds max_size", p.version()));
      }
    }
  }

  if (config.reconciliation().max_attempts() == 0) {
    throw util::ValidationError("reconciliation.max_attempts must be positive");
  }
  if (config.migration().workers() == 0 || config.migration().max_per_second() <= 0.0) {
    throw util::ValidationError("migration.workers and migration.max_per_second must be positive");
  }
  if (config.optimizer().min_samples() == 0) {
    throw util::ValidationError("optimizer.min_samples must be positive");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::ValidationError("database.sqlite.path must be set");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw util::ValidationError("database.postgres.connection_uri must be set");
  }
  if (config.vector_store().has_sqlite() && config.vector_store().sqlite().path().empty()) {
    throw util::ValidationError("vector_store.sqlite.path must be set");
  }
}

} // namespace strata::config
