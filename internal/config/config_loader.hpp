#pragma once

#include <google/protobuf/duration.pb.h>

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace strata::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Environment
  overrides are applied next, then defaults fill every unset knob, then
  the result is validated.
*/
class ConfigLoader {
 public:
  static strata::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static strata::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(strata::runtime::config::RuntimeConfig& config);

  // STRATA_DB_PATH, STRATA_VECTOR_PATH, STRATA_QUERY_ALPHA
  static void ApplyEnvOverrides(strata::runtime::config::RuntimeConfig& config);

  // Throws util::ValidationError on inconsistent values.
  static void Validate(const strata::runtime::config::RuntimeConfig& config);
};

uint64_t DurationMs(const google::protobuf::Duration& duration);

} // namespace strata::config
