#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using pulsetx::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: pulsetx-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = pulsetx::config::ConfigLoader::LoadFromYaml(config_path);

    pulsetx::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = pulsetx::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PULSETX_LOG_INFO("pulsetx started", {pulsetx::observability::StringField("bind_address", config.server().bind_address()),
                                         pulsetx::observability::BoolField("heart_rate_authorized", config.biometric().read_authorized())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PULSETX_LOG_INFO("Shutting down pulsetx");

    server.Stop();
    app.sessions.reset();
    pulsetx::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PULSETX_LOG_ERROR("Fatal error", {pulsetx::observability::StringField("error", e.what())});
    pulsetx::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
