#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using orchestrator::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "orchestrator_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejected(const std::string& yaml, const std::string& needle) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.server().bind_address() == "0.0.0.0:50071");
  assert(config.store().has_memory());
  assert(config.store().retry_attempts() == 3);
  assert(config.store().retry_backoff_ms() == 50);
  assert(config.store().session_ttl_ms() == 15000);
  assert(config.scheduler().has_labels());
  assert(config.reconcile().fallback_tick_ms() == 1000);
  assert(config.reconcile().watch_slice_ms() == 250);
  assert(config.reconcile().farm_poll_ms() == 1000);
  assert(config.logging().level() == "info");
}

void TestFullFileLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
store:
  sqlite:
    path: "/var/lib/orchestrator/coordination.db"
  retry_attempts: 5
  session_ttl_ms: 20000
scheduler:
  http:
    endpoint: "http://inventory.local/nodes"
    headers:
      Authorization: "Bearer token"
reconcile:
  fallback_tick_ms: 2000
  watch_slice_ms: 100
logging:
  level: debug
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.store().sqlite().path() == "/var/lib/orchestrator/coordination.db");
  assert(config.store().retry_attempts() == 5);
  assert(config.store().retry_backoff_ms() == 50);
  assert(config.scheduler().http().endpoint() == "http://inventory.local/nodes");
  assert(config.scheduler().http().headers().at("Authorization") == "Bearer token");
  assert(config.scheduler().http().timeout_ms() == 5000);
  assert(config.reconcile().fallback_tick_ms() == 2000);
  assert(config.logging().level() == "debug");
}

void TestBareBackendKeySelectsIt() {
  const auto config = ConfigLoader::LoadFromYamlString("store:\n  memory:\n");
  assert(config.store().has_memory());
}

void TestInvalidConfigsRejected() {
  assert(Rejected("store:\n  sqlite:\n", "store.sqlite.path"));
  assert(Rejected("store:\n  retry_attempts: 1000\n", "retry_attempts"));
  assert(Rejected("store:\n  session_ttl_ms: 10\n", "session_ttl_ms"));
  assert(Rejected("scheduler:\n  http:\n    timeout_ms: 10\n", "scheduler.http.endpoint"));
  assert(Rejected("reconcile:\n  fallback_tick_ms: 100\n  watch_slice_ms: 500\n", "watch_slice_ms"));
  assert(Rejected("store:\n  session_ttl_ms: 2000\nreconcile:\n  farm_poll_ms: 1000\n", "farm_poll_ms"));
  assert(Rejected("unknown_section:\n  x: 1\n", "Invalid configuration"));
}

void TestMissingFileReported() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/orchestrator.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestFullFileLoads();
  TestBareBackendKeySelectsIt();
  TestInvalidConfigsRejected();
  TestMissingFileReported();

  std::cout << "orchestrator_unit_config_loader: pass\n";
  return 0;
}
