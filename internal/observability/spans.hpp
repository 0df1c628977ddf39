#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace treasury::runtime::config {
class RuntimeConfig;
}

namespace treasury::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string   service_name{"treasury-ledger"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

#ifdef ENABLE_OTEL
OtlpConfig OtlpConfigFrom(const treasury::runtime::config::RuntimeConfig& config);

// Explicit endpoint, then the per-signal env var, then OTEL_EXPORTER_OTLP_ENDPOINT,
// then the collector default for the transport.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal_env, std::string_view http_path);
#endif

bool InitializeTracing(const treasury::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const treasury::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  // Expected ledger rejection; tags the span but keeps its status OK.
  void RecordRejection(std::string_view kind, std::string_view description);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

  Ledger gauges are last-write-wins per ledger id; the host publishes
  them after every committed mutation.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void SetCirculatingSupply(std::string_view ledger_id, std::uint64_t supply);
  void SetCollateralRatioBps(std::string_view ledger_id, std::uint64_t ratio_bps);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const treasury::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const treasury::runtime::config::RuntimeConfig&) {
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

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordRejection(std::string_view, std::string_view) {
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

inline void Metrics::SetCirculatingSupply(std::string_view, std::uint64_t) {
}

inline void Metrics::SetCollateralRatioBps(std::string_view, std::uint64_t) {
}
#endif

} // namespace treasury::observability
