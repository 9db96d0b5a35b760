#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace ledcast::runtime::config {
class RuntimeConfig;
}

namespace ledcast::observability {

// Both are no-ops returning false unless the matching observability flag is set.
bool InitializeTracing(const ledcast::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ledcast::runtime::config::RuntimeConfig& config);
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
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
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

  // Catalog RPCs.
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Conversion outcome per geometry: "succeeded", "failed", "skipped", "abandoned".
  void RecordConversion(std::string_view geometry, std::string_view outcome);
  void ObserveConversionDurationMs(double duration_ms);

  void RecordFramesSent(std::string_view geometry, std::uint64_t frames);
  void RecordFramesDropped(std::string_view geometry, std::uint64_t frames);
  void RecordEvictions(std::uint64_t count);

  void SetCacheBytes(std::uint64_t bytes);
  void SetActiveSessions(std::uint64_t sessions);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const ledcast::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const ledcast::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
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

inline void Metrics::RecordConversion(std::string_view, std::string_view) {
}

inline void Metrics::ObserveConversionDurationMs(double) {
}

inline void Metrics::RecordFramesSent(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordFramesDropped(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordEvictions(std::uint64_t) {
}

inline void Metrics::SetCacheBytes(std::uint64_t) {
}

inline void Metrics::SetActiveSessions(std::uint64_t) {
}
#endif

} // namespace ledcast::observability
