#pragma once

#include <stdexcept>
#include <string>

namespace strata::util {

/*
  Central error types.

  Ingestion-time failures surface as these exceptions. Background
  reconciliation and migration failures are recorded on the record
  (status, repair task, incident) and never thrown into request paths.
*/

// Missing or malformed input. Raised before any write; not retryable.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Timeout or network fault talking to either store. Retried with backoff.
class TransientStoreError : public std::runtime_error {
 public:
  explicit TransientStoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Read-back verification of a new location failed.
class ConsistencyViolation : public std::runtime_error {
 public:
  explicit ConsistencyViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RecommendationConflict : public std::runtime_error {
 public:
  explicit RecommendationConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by cooperative cancellation checks inside background tasks.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace strata::util
