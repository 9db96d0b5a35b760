#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/conversion_scheduler.hpp"
#include "internal/stream/stream_server.hpp"
#if LEDCAST_WITH_GRPC
#include "internal/grpc/catalog_server.hpp"
#include "internal/runtime/server.hpp"
#endif

static volatile std::sig_atomic_t g_running      = 1;
static volatile std::sig_atomic_t g_scan_request = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleScanSignal(int) {
  g_scan_request = 1;
}

static void ShutdownObservability() {
  ledcast::observability::ShutdownLogging();
  ledcast::observability::ShutdownMetrics();
  ledcast::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: ledcast <config.yaml> OR ledcast --config <config.yaml>" << std::endl;
    return 1;
  }

  ledcast::observability::InitializeDefaultLogging();

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ledcast::config::ConfigLoader::Load(config_path);

    ledcast::observability::InitializeTracing(config);
    ledcast::observability::InitializeMetrics(config);
    ledcast::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = ledcast::factory::Build(config);

    // Register signal handlers before starting threads to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGUSR1, HandleScanSignal);

    app.Start();

#if LEDCAST_WITH_GRPC
    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<ledcast::grpc::CatalogServer>(app.catalog));
    ledcast::runtime::Server server(config.catalog().bind_address(), std::move(services));
    server.Start();
#endif

    LEDCAST_LOG_INFO("ledcast started", {ledcast::observability::IntField("stream_port", app.stream->BoundPort()),
                                         ledcast::observability::StringField("source_dir", config.scheduler().source_dir())});

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (g_scan_request) {
        g_scan_request = 0;
        LEDCAST_LOG_INFO("scan requested by signal");
        app.scheduler->TriggerScan();
      }
    }

    LEDCAST_LOG_INFO("shutting down ledcast");

#if LEDCAST_WITH_GRPC
    server.Stop();
#endif
    app.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    LEDCAST_LOG_ERROR("Fatal error", {ledcast::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
