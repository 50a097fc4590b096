#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/renter_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using renter::runtime::Server;

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
    std::cerr << "Usage: renter-control <config.yaml> OR renter-control --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = renter::config::ConfigLoader::LoadFromYaml(config_path);

    renter::observability::InitializeLogging(config);
    renter::observability::InitializeTracing(config);
    renter::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = renter::factory::Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<renter::grpc::RenterServer>(app.control));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:9980")
                                                                     : config.server().bind_address();
    Server server(bind_address, std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RENTER_LOG_INFO("Shutting down renter-control");

    server.Stop();
    renter::observability::ShutdownMetrics();
    renter::observability::ShutdownTracing();
    renter::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    RENTER_LOG_ERROR("Fatal error", {renter::observability::StringField("error", e.what())});
    renter::observability::ShutdownMetrics();
    renter::observability::ShutdownTracing();
    renter::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
