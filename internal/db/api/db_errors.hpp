#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace strata::db {

// Maps a failed repository Result onto the util exception hierarchy.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw strata::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw strata::util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw strata::util::InvalidState(message);
    case ErrorCode::Busy:
    case ErrorCode::IOError:
      throw strata::util::TransientStoreError(message);
    default:
      throw std::runtime_error(message);
  }
}

inline bool IsUniqueViolation(const Result& result) {
  return result.code == ErrorCode::AlreadyExists || result.code == ErrorCode::ConstraintViolation;
}

} // namespace strata::db
