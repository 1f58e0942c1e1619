#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"

using ledger::runtime::Server;

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
    std::cerr << "Usage: ledger-engine <config.yaml> OR ledger-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ledger::config::ConfigLoader::LoadFromYaml(config_path);

    ledger::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = ledger::factory::Build(config, std::make_shared<ledger::util::SystemClock>());

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<ledger::grpc::LedgerServer>(app.service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    if (app.cycle_worker) {
      app.cycle_worker->Start();
    }
    LEDGER_LOG_INFO("Ledger engine started", {ledger::observability::StringField("bind_address", config.server().bind_address()),
                                              ledger::observability::BoolField("scheduler", app.cycle_worker != nullptr)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LEDGER_LOG_INFO("Shutting down ledger engine");

    if (app.cycle_worker) {
      app.cycle_worker->Stop();
    }
    server.Stop();
    ledger::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("Fatal error", {ledger::observability::StringField("error", e.what())});
    ledger::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
