#include <curl/curl.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/rc_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/rc_service.hpp"

using orchestrator::runtime::Server;

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
    std::cerr << "Usage: rc-manager <config.yaml> OR rc-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  curl_global_init(CURL_GLOBAL_DEFAULT);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = orchestrator::config::ConfigLoader::LoadFromYaml(config_path);

    orchestrator::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto rt = orchestrator::factory::BuildRuntime(config);

    orchestrator::service::ServiceContext ctx;
    ctx.rcs        = rt.rcs;
    ctx.applicator = rt.labels;
    ctx.tracker    = rt.tracker;

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<orchestrator::grpc::RcServer>(std::make_shared<orchestrator::service::RcService>(ctx)));

    // ------------------------------------------------------------
    // Start server and reconciliation
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    rt.farm->Start();
    ORCHESTRATOR_LOG_INFO("rc-manager started", {orchestrator::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    ORCHESTRATOR_LOG_INFO("Shutting down rc-manager");

    // every watch loop acknowledges quit before we exit
    rt.farm->Stop();
    server.Stop();
    orchestrator::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_ERROR("Fatal error", {orchestrator::observability::StringField("error", e.what())});
    orchestrator::observability::ShutdownLogging();
    curl_global_cleanup();
    return 2;
  }

  curl_global_cleanup();
  return 0;
}
