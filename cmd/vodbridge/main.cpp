#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/content_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/runtime/server.hpp"

using vodbridge::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  vodbridge::observability::ShutdownLogging();
  vodbridge::observability::ShutdownMetrics();
  vodbridge::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: vodbridge <config.yaml> OR vodbridge --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = vodbridge::config::ConfigLoader::LoadFromYaml(config_path);

    vodbridge::observability::InitializeTracing(config);
    vodbridge::observability::InitializeMetrics(config);
    vodbridge::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = vodbridge::factory::Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<vodbridge::grpc::ContentServer>(app.content_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    VODBRIDGE_LOG_INFO("vodbridge started",
                       {vodbridge::observability::StringField("bind_address", config.server().bind_address()),
                        vodbridge::observability::StringField("jsonrpc_url", config.host().jsonrpc_url())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    VODBRIDGE_LOG_INFO("Shutting down vodbridge");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    VODBRIDGE_LOG_ERROR("Fatal error", {vodbridge::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
