#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "strata/engine/v1.hpp"

namespace {

namespace v1 = strata::engine::v1;

using strata::config::ConfigLoader;
using strata::config::DurationMs;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "strata_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ClearEnv() {
  unsetenv("STRATA_DB_PATH");
  unsetenv("STRATA_VECTOR_PATH");
  unsetenv("STRATA_QUERY_ALPHA");
}

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const strata::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.database().has_memory());
  assert(config.vector_store().has_memory());
  assert(config.logging().level() == "info");
  assert(config.query().alpha() == 0.5);
  assert(config.coordinator().chunk_size() == 1000);
  assert(config.coordinator().chunk_overlap() == 200);
  assert(DurationMs(config.consistency().gc_grace()) == 10 * 60 * 1000);
  assert(DurationMs(config.query().subquery_timeout()) == 2000);
  assert(config.reconciliation().max_attempts() == 3);
  assert(config.optimizer().max_buffered_samples() == 10000);

  assert(config.placement().policies_size() == 1);
  const auto& policy = config.placement().policies(0);
  assert(policy.version() == 1);
  assert(policy.size_small() == 50 * 1024);
  assert(policy.size_large() == 50 * 1024 * 1024);
  assert(policy.overrides_size() == 1);
  assert(policy.overrides(0).strategy() == v1::STRATEGY_SPECIALIZED_TABLE);
  assert(policy.high_value_domains_size() == 3);
}

void TestYamlFileWithDurationsAndEnums() {
  const auto yaml_path = WriteYaml("full", R"(database:
  sqlite:
    path: "/tmp/strata/records.db"
query:
  alpha: 0
  subquery_timeout: 0.25s
consistency:
  gc_grace: 90s
placement:
  policies:
    - version: 1
    - version: 3
      size_small: 102400
      overrides:
        - domain: legal
          strategy: STRATEGY_HYBRID
          min_size: 1024
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "/tmp/strata/records.db");
  // an explicit zero is kept rather than defaulted
  assert(config.query().has_alpha() && config.query().alpha() == 0.0);
  assert(DurationMs(config.query().subquery_timeout()) == 250);
  assert(DurationMs(config.consistency().gc_grace()) == 90 * 1000);

  assert(config.placement().policies_size() == 2);
  const auto& v3 = config.placement().policies(1);
  assert(v3.version() == 3);
  assert(v3.size_small() == 102400);
  assert(v3.size_medium() == 1024 * 1024);
  assert(v3.overrides(0).strategy() == v1::STRATEGY_HYBRID);
  assert(v3.overrides(0).confidence() == 0.9);
}

void TestEnvironmentOverridesFile() {
  setenv("STRATA_DB_PATH", "/data/env.db", 1);
  setenv("STRATA_VECTOR_PATH", "/data/env-vectors.db", 1);
  setenv("STRATA_QUERY_ALPHA", "0.8", 1);

  const auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "/from/yaml.db"
query:
  alpha: 0.2
)");
  assert(config.database().sqlite().path() == "/data/env.db");
  assert(config.vector_store().sqlite().path() == "/data/env-vectors.db");
  assert(config.query().alpha() == 0.8);

  setenv("STRATA_QUERY_ALPHA", "high", 1);
  assert(ThrowsValidation([] { (void)ConfigLoader::LoadFromYamlString(""); }));

  setenv("STRATA_QUERY_ALPHA", "1.5", 1);
  assert(ThrowsValidation([] { (void)ConfigLoader::LoadFromYamlString(""); }));
  ClearEnv();
}

void TestInconsistentValuesAreRejected() {
  assert(ThrowsValidation([] { (void)ConfigLoader::LoadFromYamlString("query:\n  alpha: 1.01\n"); }));
  assert(ThrowsValidation([] {
    (void)ConfigLoader::LoadFromYamlString("coordinator:\n  chunk_size: 500\n  chunk_overlap: 500\n");
  }));
  assert(ThrowsValidation([] {
    (void)ConfigLoader::LoadFromYamlString("placement:\n  policies:\n    - version: 2\n    - version: 2\n");
  }));
  assert(ThrowsValidation([] {
    (void)ConfigLoader::LoadFromYamlString("placement:\n  policies:\n    - version: 1\n      size_small: 4194304\n");
  }));
  assert(ThrowsValidation([] { (void)ConfigLoader::LoadFromYamlString("query: [unclosed\n"); }));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(query:
  alpha: 0.5
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");

  threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/strata.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  ClearEnv();
  TestEmptyDocumentGetsDefaults();
  TestYamlFileWithDurationsAndEnums();
  TestEnvironmentOverridesFile();
  TestInconsistentValuesAreRejected();
  TestUnknownFieldsAreRejected();

  std::cout << "strata_unit_config_loader: pass\n";
  return 0;
}
