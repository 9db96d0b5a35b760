#include "internal/observability/otlp_export.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace ledcast::observability {

namespace {

const char* SignalEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string_view SignalPath(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "/v1/traces" : "/v1/metrics";
}

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

std::string WithSignalPath(std::string base, OtlpSignal signal) {
  const auto path = SignalPath(signal);
  if (EndsWith(base, path)) {
    return base;
  }
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  base.append(path);
  return base;
}

} // namespace

OtlpTarget ResolveOtlpTarget(const ledcast::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  OtlpTarget target;
  target.http = config.transport() == ledcast::runtime::config::OTLP_TRANSPORT_HTTP;

  const char* signal_endpoint  = std::getenv(SignalEnv(signal));
  const char* general_endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT");

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = target.http ? WithSignalPath(config.otlp_endpoint(), signal) : config.otlp_endpoint();
  } else if (signal_endpoint && *signal_endpoint) {
    target.endpoint = signal_endpoint;
  } else if (general_endpoint && *general_endpoint) {
    target.endpoint = target.http ? WithSignalPath(general_endpoint, signal) : std::string(general_endpoint);
  } else {
    target.endpoint = target.http ? WithSignalPath("http://localhost:4318", signal) : std::string("localhost:4317");
  }

  target.tls = target.endpoint.rfind("https://", 0) == 0;
  return target;
}

ResourceAttributeList ServiceAttributes(const ledcast::runtime::config::RuntimeConfig& config) {
  std::string geometries;
  for (const auto& tag : config.geometries()) {
    if (!geometries.empty()) {
      geometries.push_back(',');
    }
    geometries.append(tag);
  }

  ResourceAttributeList attrs;
  attrs.emplace_back("service.name", std::string(kServiceName));
  attrs.emplace_back("service.version", std::string(kServiceVersion));
  attrs.emplace_back("ledcast.geometries", geometries);
  attrs.emplace_back("ledcast.stream.port", std::to_string(config.stream().port()));
  if (!config.cache().root().empty()) {
    attrs.emplace_back("ledcast.cache.root", config.cache().root());
  }
  return attrs;
}

} // namespace ledcast::observability
