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

using treasury::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  treasury::observability::ShutdownLogging();
  treasury::observability::ShutdownMetrics();
  treasury::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: treasury-ledger <config.yaml> OR treasury-ledger --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = treasury::config::ConfigLoader::LoadFromYaml(config_path);

    treasury::observability::InitializeTracing(config);
    treasury::observability::InitializeMetrics(config);
    treasury::observability::InitializeLogging(config);

    auto app = treasury::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TREASURY_LOG_INFO("treasury ledger started", {treasury::observability::StringField("bind_address", config.server().bind_address()),
                                                  treasury::observability::StringField("database", config.database().has_sqlite() ? "sqlite" : "memory")});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TREASURY_LOG_INFO("shutting down treasury ledger");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    TREASURY_LOG_ERROR("Fatal error", {treasury::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
