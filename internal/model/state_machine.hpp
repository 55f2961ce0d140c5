#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"
#include "strata/engine/v1.hpp"

namespace strata::model {

using strata::engine::v1::RecordStatus;

constexpr std::string_view ToString(RecordStatus status) {
  switch (status) {
    case strata::engine::v1::RECORD_STATUS_READY:
      return "ready";
    case strata::engine::v1::RECORD_STATUS_DEGRADED:
      return "degraded";
    case strata::engine::v1::RECORD_STATUS_MIGRATING:
      return "migrating";
    default:
      return "unspecified";
  }
}

/*
  (new)     -> ready | degraded
  ready     -> degraded | migrating
  degraded  -> ready (after verified repair)
  migrating -> ready (swap or abort)

  A degraded record is repaired before it may migrate.
*/
constexpr bool CanTransition(RecordStatus from, RecordStatus to) {
  if (from == to) {
    return true;
  }
  switch (from) {
    case strata::engine::v1::RECORD_STATUS_UNSPECIFIED:
      return to == strata::engine::v1::RECORD_STATUS_READY || to == strata::engine::v1::RECORD_STATUS_DEGRADED;
    case strata::engine::v1::RECORD_STATUS_READY:
      return to == strata::engine::v1::RECORD_STATUS_DEGRADED || to == strata::engine::v1::RECORD_STATUS_MIGRATING;
    case strata::engine::v1::RECORD_STATUS_DEGRADED:
      return to == strata::engine::v1::RECORD_STATUS_READY;
    case strata::engine::v1::RECORD_STATUS_MIGRATING:
      return to == strata::engine::v1::RECORD_STATUS_READY;
    default:
      return false;
  }
}

// Returns `to`; InvalidState on an edge CanTransition rejects.
inline RecordStatus CheckedTransition(const std::string& record_id, RecordStatus from, RecordStatus to) {
  if (!CanTransition(from, to)) {
    throw util::InvalidState("record " + record_id + ": illegal status change " + std::string(ToString(from)) + " -> " +
                             std::string(ToString(to)));
  }
  return to;
}

// Records in these states have a resolvable pointer for readers.
constexpr bool IsReadable(RecordStatus status) {
  return status == strata::engine::v1::RECORD_STATUS_READY || status == strata::engine::v1::RECORD_STATUS_DEGRADED ||
         status == strata::engine::v1::RECORD_STATUS_MIGRATING;
}

} // namespace strata::model
