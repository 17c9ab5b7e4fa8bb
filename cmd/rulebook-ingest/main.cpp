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

using rulebook::factory::Build;
using rulebook::runtime::Server;

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
    std::cerr << "Usage: rulebook-ingest <config.yaml> OR rulebook-ingest --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = rulebook::config::ConfigLoader::LoadFromYaml(config_path);

    rulebook::observability::InitializeTracing(config);
    rulebook::observability::InitializeMetrics(config);
    rulebook::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph, workers running)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RULEBOOK_LOG_INFO("rulebook-ingest started", {rulebook::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RULEBOOK_LOG_INFO("Shutting down rulebook-ingest");

    server.Stop();
    rulebook::factory::Shutdown(app);

    rulebook::observability::ShutdownLogging();
    rulebook::observability::ShutdownMetrics();
    rulebook::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RULEBOOK_LOG_ERROR("Fatal error", {rulebook::observability::StringField("error", e.what())});
    rulebook::observability::ShutdownLogging();
    rulebook::observability::ShutdownMetrics();
    rulebook::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
