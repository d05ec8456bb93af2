#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using waveq::factory::Build;
using waveq::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: waveq-engine <config.yaml> OR waveq-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = waveq::config::ConfigLoader::LoadFromYaml(config_path);

    waveq::observability::InitializeTracing(config);
    waveq::observability::InitializeMetrics(config);
    waveq::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start workers and server
    // ------------------------------------------------------------
    Server server(config.server(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    server.Start();
    WAVEQ_LOG_INFO("WaveQ engine started", {waveq::observability::StringField("bind_address", config.server().bind_address()),
                                            waveq::observability::IntField("workers", app.workers->Size())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    WAVEQ_LOG_INFO("Shutting down WaveQ engine");

    server.Stop();
    app.Stop();
    waveq::observability::ShutdownLogging();
    waveq::observability::ShutdownMetrics();
    waveq::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    WAVEQ_LOG_ERROR("Fatal error", {waveq::observability::StringField("error", e.what())});
    waveq::observability::ShutdownLogging();
    waveq::observability::ShutdownMetrics();
    waveq::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
