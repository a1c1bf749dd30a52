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

using warranty::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownTelemetry() {
  warranty::observability::ShutdownLogging();
  warranty::observability::ShutdownMetrics();
  warranty::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: warranty-server <config.yaml> OR warranty-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = warranty::config::ConfigLoader::LoadFromYaml(config_path);

    warranty::observability::InitializeTracing(config);
    warranty::observability::InitializeMetrics(config);
    warranty::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = warranty::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    warranty::runtime::ServerOptions options;
    if (!config.server().bind_address().empty()) options.bind_address = config.server().bind_address();
    options.max_receive_message_bytes = config.server().max_receive_message_bytes();

    Server server(options, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    WARRANTY_LOG_INFO("Warranty server started", {warranty::observability::StringField("bind_address", options.bind_address),
                                                 warranty::observability::IntField("port", server.Port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    WARRANTY_LOG_INFO("Shutting down warranty server");

    server.Stop();
    app.Shutdown();
    ShutdownTelemetry();
  } catch (const std::exception& e) {
    WARRANTY_LOG_ERROR("Fatal error", {warranty::observability::StringField("error", e.what())});
    std::cerr << "fatal: " << e.what() << std::endl;
    ShutdownTelemetry();
    return 2;
  }

  return 0;
}
