#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "internal/util/cancel.hpp"
#include "strata/engine/v1.hpp"

namespace strata::migration {

enum class Outcome {
  kSucceeded,
  kUnchanged,
  kCancelled,
  kFailed,
};

constexpr const char* ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kSucceeded:
      return "succeeded";
    case Outcome::kUnchanged:
      return "unchanged";
    case Outcome::kCancelled:
      return "cancelled";
    default:
      return "failed";
  }
}

struct MigrationResult {
  std::string record_id;
  Outcome     outcome = Outcome::kFailed;
  std::string error;
  double      duration_ms = 0.0;
};

/*
  A scheduled strategy change for one record.
*/
struct MigrationTask {
  std::string                  record_id;
  strata::engine::v1::Strategy target         = strata::engine::v1::STRATEGY_UNSPECIFIED;
  uint32_t                     policy_version = 0;
  util::CancelToken            cancel;

  std::shared_ptr<std::promise<MigrationResult>> done;
};

} // namespace strata::migration
