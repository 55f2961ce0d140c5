#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace strata::runtime::config {
class RuntimeConfig;
}

namespace strata::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"strata-engine"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const strata::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const strata::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordIngest(std::string_view strategy);
  void ObserveQueryLatencyMs(std::string_view mode, double latency_ms);
  void RecordPartialQuery();
  void ObserveMigrationDurationMs(std::string_view outcome, double duration_ms);
  void SetDegradedRecords(std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const strata::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const strata::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordIngest(std::string_view) {
}

inline void Metrics::ObserveQueryLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordPartialQuery() {
}

inline void Metrics::ObserveMigrationDurationMs(std::string_view, double) {
}

inline void Metrics::SetDegradedRecords(std::uint64_t) {
}
#endif

} // namespace strata::observability
