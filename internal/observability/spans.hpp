#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace warranty::runtime::config {
class RuntimeConfig;
}

namespace warranty::observability {

/*
  Telemetry for the warranty core.

  Everything here compiles to no-ops unless the build sets
  WARRANTY_ENABLE_OTEL; call sites never need their own #ifdef.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by traces and metrics.
struct OtlpSettings {
  std::string   service_name{"warranty-core"};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpSettings OtlpSettingsFrom(const warranty::runtime::config::RuntimeConfig& config);

// Both return false when the section is disabled.
bool InitializeTracing(const warranty::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const warranty::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Span made current for its lifetime.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef WARRANTY_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // RPC surface
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Batch generation
  void AddBarcodesGenerated(std::uint64_t count);
  void RecordCollision(std::string_view type);
  void ObserveChunkCommitMs(double duration_ms);

  // Claim workflow
  void RecordClaimTransition(std::string_view action);

 private:
  Metrics();
#ifdef WARRANTY_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef WARRANTY_ENABLE_OTEL
inline OtlpSettings OtlpSettingsFrom(const warranty::runtime::config::RuntimeConfig&) {
  return {};
}

inline bool InitializeTracing(const warranty::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const warranty::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::AddBarcodesGenerated(std::uint64_t) {
}

inline void Metrics::RecordCollision(std::string_view) {
}

inline void Metrics::ObserveChunkCommitMs(double) {
}

inline void Metrics::RecordClaimTransition(std::string_view) {
}
#endif

} // namespace warranty::observability
