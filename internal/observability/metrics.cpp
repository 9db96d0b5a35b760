#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define LEDCAST_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define LEDCAST_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_export.hpp"

namespace ledcast::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

bool InstallProvider(const ledcast::runtime::config::RuntimeConfig& config, std::chrono::milliseconds interval,
                     std::chrono::milliseconds timeout) {
  const auto target = ResolveOtlpTarget(config.observability(), OtlpSignal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = target.endpoint;
    options.use_ssl_credentials = target.tls;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
  if (timeout.count() > 0) {
    reader_options.export_timeout_millis = timeout;
  }
#ifdef LEDCAST_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildServiceResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  LEDCAST_LOG_INFO("metrics enabled", {StringField("endpoint", target.endpoint), IntField("interval_ms", interval.count())});
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> conversion_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      conversion_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> frames_sent;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> frames_dropped;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> evictions;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   cache_bytes_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   sessions_gauge;

  std::atomic<std::int64_t> cache_bytes{0};
  std::atomic<std::int64_t> active_sessions{0};
};

bool InitializeMetrics(const ledcast::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto interval_ms = observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : 1000;
  return InstallProvider(config, std::chrono::milliseconds(interval_ms), std::chrono::milliseconds(observability.export_timeout_ms()));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("ledcast", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("ledcast.catalog.request.count", "1", "Catalog requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("ledcast.catalog.request.latency_ms", "ms", "Catalog request latency");
  impl_->conversion_count   = impl_->meter->CreateUInt64Counter("ledcast.conversion.count", "1", "Per-geometry conversion outcomes");
  impl_->conversion_duration_ms =
      impl_->meter->CreateDoubleHistogram("ledcast.conversion.duration_ms", "ms", "Duration of one source conversion across all geometries");
  impl_->frames_sent    = impl_->meter->CreateUInt64Counter("ledcast.stream.frames_sent", "1", "Frames written to display clients");
  impl_->frames_dropped = impl_->meter->CreateUInt64Counter("ledcast.stream.frames_dropped", "1", "Frames dropped on backpressure");
  impl_->evictions      = impl_->meter->CreateUInt64Counter("ledcast.cache.evictions", "1", "Artifacts evicted to respect capacity");

  impl_->cache_bytes_gauge = impl_->meter->CreateInt64ObservableGauge("ledcast.cache.bytes", "Bytes held by cached artifacts", "By");
  impl_->cache_bytes_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->cache_bytes.load());
      },
      impl_.get());

  impl_->sessions_gauge = impl_->meter->CreateInt64ObservableGauge("ledcast.stream.sessions", "Connected display clients", "1");
  impl_->sessions_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->active_sessions.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordConversion(std::string_view geometry, std::string_view outcome) {
  if (!impl_ || !impl_->conversion_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"geometry", std::string(geometry)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->conversion_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveConversionDurationMs(double duration_ms) {
  if (!impl_ || !impl_->conversion_duration_ms) {
    return;
  }
  RecordWithAttributes(impl_->conversion_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordFramesSent(std::string_view geometry, std::uint64_t frames) {
  if (!impl_ || !impl_->frames_sent || frames == 0) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"geometry", std::string(geometry)}};
  AddWithAttributes(impl_->frames_sent, frames, attributes);
}

void Metrics::RecordFramesDropped(std::string_view geometry, std::uint64_t frames) {
  if (!impl_ || !impl_->frames_dropped || frames == 0) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"geometry", std::string(geometry)}};
  AddWithAttributes(impl_->frames_dropped, frames, attributes);
}

void Metrics::RecordEvictions(std::uint64_t count) {
  if (!impl_ || !impl_->evictions || count == 0) {
    return;
  }
  AddWithAttributes(impl_->evictions, count, std::initializer_list<AttributePair>{});
}

void Metrics::SetCacheBytes(std::uint64_t bytes) {
  if (impl_) {
    impl_->cache_bytes.store(static_cast<std::int64_t>(bytes));
  }
}

void Metrics::SetActiveSessions(std::uint64_t sessions) {
  if (impl_) {
    impl_->active_sessions.store(static_cast<std::int64_t>(sessions));
  }
}

} // namespace ledcast::observability

#endif
