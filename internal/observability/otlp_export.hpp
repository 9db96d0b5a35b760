#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifdef ENABLE_OTEL
#include <opentelemetry/sdk/resource/resource.h>
#endif

namespace ledcast::runtime::config {
class RuntimeConfig;
class ObservabilityConfig;
} // namespace ledcast::runtime::config

namespace ledcast::observability {

inline constexpr std::string_view kServiceName    = "ledcast";
inline constexpr std::string_view kServiceVersion = "0.1.0";

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpTarget {
  std::string endpoint;
  bool        http{false};
  bool        tls{false};
};

using ResourceAttributeList = std::vector<std::pair<std::string, std::string>>;

/*
  Endpoint precedence: observability.otlp_endpoint, then
  OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT (used verbatim), then
  OTEL_EXPORTER_OTLP_ENDPOINT. Over HTTP a base endpoint gets the
  per-signal path appended.
*/
OtlpTarget ResolveOtlpTarget(const ledcast::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

// Attributes stamped on every exported span and metric.
ResourceAttributeList ServiceAttributes(const ledcast::runtime::config::RuntimeConfig& config);

#ifdef ENABLE_OTEL
inline opentelemetry::sdk::resource::Resource BuildServiceResource(const ledcast::runtime::config::RuntimeConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attrs;
  for (const auto& [key, value] : ServiceAttributes(config)) {
    attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}
#endif

} // namespace ledcast::observability
