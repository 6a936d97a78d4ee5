#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/transfer_process_manager.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using transfer::factory::Build;
using transfer::runtime::Server;

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
    std::cerr << "Usage: transfer-manager <config.yaml> OR transfer-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = transfer::config::ConfigLoader::LoadFromYaml(config_path);

    transfer::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server and manager loop
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.manager->Start(app.store);
    TRANSFER_LOG_INFO("Transfer manager started", {transfer::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) {
      if (app.manager->State() == transfer::core::Lifecycle::kFailed) {
        TRANSFER_LOG_CRITICAL("Transfer process manager failed; shutting down");
        break;
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    TRANSFER_LOG_INFO("Shutting down transfer manager");

    const bool failed = app.manager->State() == transfer::core::Lifecycle::kFailed;
    server.Stop();
    app.manager->Stop();
    transfer::observability::ShutdownLogging();
    return failed ? 3 : 0;
  } catch (const std::exception& e) {
    TRANSFER_LOG_ERROR("Fatal error", {transfer::observability::StringField("error", e.what())});
    transfer::observability::ShutdownLogging();
    return 2;
  }
}
