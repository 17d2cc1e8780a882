#include <curl/curl.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/kp/manifest.hpp"
#include "internal/kp/pod_store.hpp"
#include "internal/labels/http_applicator.hpp"
#include "internal/labels/kv_applicator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rc/replication_controller.hpp"
#include "internal/rc/status_pump.hpp"
#include "internal/rcstore/fake_store.hpp"
#include "internal/rcstore/kv_store.hpp"
#include "internal/status/tracker.hpp"
#include "internal/util/errors.hpp"

using namespace orchestrator;
using observability::IntField;
using observability::StringField;

namespace {

struct Flags {
  std::string                        manifest;
  std::string                        store = "memory";
  std::string                        sqlite_path;
  std::string                        node_endpoint;
  std::string                        selector;
  int                                nodes = 1;
  std::map<std::string, std::string> headers;
  std::vector<std::string>           local_nodes;
  int                                poll_ms    = 3000;
  int                                timeout_s  = 300;
  bool                               wait_watch = false;
};

void Usage() {
  std::cerr << "Usage: mini-orchestrator [flags] <manifest.yaml>\n"
            << "\n"
            << "Deploys the pod in <manifest.yaml> to --nodes nodes matching --selector,\n"
            << "waits for convergence, then tears the replication controller down.\n"
            << "\n"
            << "  --store memory|sqlite     coordination store backend (default memory)\n"
            << "  --sqlite-path <file>      database file for --store sqlite\n"
            << "  --node-endpoint <url>     node inventory endpoint to query for selector matches\n"
            << "  --header KEY=VALUE        extra HTTP header for the node inventory (repeatable)\n"
            << "  --selector <expr>         node selector\n"
            << "  --nodes <n>               replicas to deploy (default 1)\n"
            << "  --node <name>             register a local node matching the selector (repeatable)\n"
            << "  --poll-ms <ms>            CurrentNodes poll interval (default 3000)\n"
            << "  --wait watch|poll         wait for convergence on label notifications or by polling\n"
            << "  --timeout-s <s>           give up waiting for convergence (default 300)\n";
}

[[noreturn]] void Fatal(const std::string& message) {
  throw std::runtime_error(message);
}

Flags ParseFlags(int argc, char** argv) {
  Flags flags;

  auto value = [&](int& i) -> std::string {
    if (i + 1 >= argc) Fatal(std::string("missing value for ") + argv[i]);
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--store") {
      flags.store = value(i);
    } else if (arg == "--sqlite-path") {
      flags.sqlite_path = value(i);
    } else if (arg == "--node-endpoint") {
      flags.node_endpoint = value(i);
    } else if (arg == "--selector") {
      flags.selector = value(i);
    } else if (arg == "--nodes") {
      flags.nodes = std::stoi(value(i));
    } else if (arg == "--header") {
      const auto header = value(i);
      const auto eq     = header.find('=');
      if (eq == std::string::npos || eq == 0) Fatal("invalid header '" + header + "', expected KEY=VALUE");
      flags.headers[header.substr(0, eq)] = header.substr(eq + 1);
    } else if (arg == "--node") {
      flags.local_nodes.push_back(value(i));
    } else if (arg == "--poll-ms") {
      flags.poll_ms = std::stoi(value(i));
    } else if (arg == "--timeout-s") {
      flags.timeout_s = std::stoi(value(i));
    } else if (arg == "--wait") {
      const auto mode = value(i);
      if (mode != "watch" && mode != "poll") Fatal("--wait must be watch or poll");
      flags.wait_watch = mode == "watch";
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      std::exit(0);
    } else if (!arg.empty() && arg[0] == '-') {
      Fatal("unknown flag " + arg);
    } else if (flags.manifest.empty()) {
      flags.manifest = arg;
    } else {
      Fatal("unexpected argument " + arg);
    }
  }

  if (flags.manifest.empty()) Fatal("manifest path is required");
  if (flags.nodes < 0) Fatal("--nodes must be >= 0");
  if (flags.store == "sqlite" && flags.sqlite_path.empty()) Fatal("--store sqlite needs --sqlite-path");
  if (flags.store != "sqlite" && flags.store != "memory") Fatal("--store must be memory or sqlite");
  return flags;
}

// Labels a node needs to satisfy the selector.
labels::Labels LabelsFor(const labels::Selector& selector) {
  labels::Labels out;
  for (const auto& req : selector.Requirements()) {
    switch (req.op) {
      case labels::Operator::Equals:
      case labels::Operator::In:
        out[req.key] = req.values.empty() ? std::string{} : req.values.front();
        break;
      case labels::Operator::Exists:
        out[req.key] = "true";
        break;
      default:
        break;
    }
  }
  return out;
}

template <typename Fn>
void ExpectNotFound(const std::string& what, Fn&& fn) {
  try {
    fn();
  } catch (const util::NotFound&) {
    return;
  }
  Fatal("Should have errored " + what + " a nonexistent ID");
}

int CheckFieldsSame(const rcstore::RC& a, const rcstore::RC& b) {
  int  mismatches = 0;
  auto try_match  = [&](const std::string& x, const std::string& y, const char* desc) {
    if (x == y) return;
    ORCHESTRATOR_LOG_ERROR("field mismatch", {StringField("field", desc), StringField("created", x), StringField("read", y)});
    ++mismatches;
  };

  try_match(a.id(), b.id(), "id");
  try_match(a.manifest().id(), b.manifest().id(), "manifest id");
  try_match(a.manifest().sha256(), b.manifest().sha256(), "manifest sha256");
  try_match(a.node_selector(), b.node_selector(), "node selector");
  if (labels::Labels(a.pod_labels().begin(), a.pod_labels().end()) != labels::Labels(b.pod_labels().begin(), b.pod_labels().end())) {
    ORCHESTRATOR_LOG_ERROR("field mismatch", {StringField("field", "pod labels")});
    ++mismatches;
  }
  try_match(a.disabled() ? "true" : "false", b.disabled() ? "true" : "false", "disabled");
  try_match(std::to_string(a.replicas_desired()), std::to_string(b.replicas_desired()), "replicas desired");
  return mismatches;
}

// Validation pass every store must survive before it is trusted with a deploy.
rcstore::RC MakeRc(rcstore::Store& store, const std::string& name, const v1::PodManifest& manifest, const std::string& selector,
                   const labels::Labels& pod_labels) {
  const std::string bogus = "BOGUSBOGUS";
  ExpectNotFound("setting", [&] { store.SetDesiredReplicas(bogus, 1); });
  ExpectNotFound("disabling", [&] { store.Disable(bogus); });
  ExpectNotFound("deleting", [&] { store.Delete(bogus); });

  auto doomed = store.Create(manifest, selector, pod_labels);
  store.Delete(doomed.id());

  auto created = store.Create(manifest, selector, pod_labels);
  auto check   = store.Get(created.id());
  if (const int mismatches = CheckFieldsSame(created, check); mismatches != 0) {
    Fatal("Mismatch of controller in " + name + " store with " + std::to_string(mismatches) + " differences");
  }
  ORCHESTRATOR_LOG_INFO("store round trip matches", {StringField("store", name)});

  int listed = 0;
  for (const auto& rc : store.List()) {
    if (rc.id() == created.id()) ++listed;
  }
  if (listed != 1) {
    Fatal("List of " + name + " store returned the new RC " + std::to_string(listed) + " times");
  }
  return created;
}

int Run(const Flags& flags) {
  const auto manifest = kp::LoadManifest(flags.manifest);
  const auto selector = labels::Selector::Parse(flags.selector);

  const labels::Labels pod_labels = {
      {"sha-truncated", manifest.sha256().substr(0, 63)},
      {"mini-orchestrator", "true"},
  };

  // ------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------
  runtime::config::StoreConfig store_config;
  if (flags.store == "sqlite") {
    store_config.mutable_sqlite()->set_path(flags.sqlite_path);
  } else {
    store_config.mutable_memory();
  }
  store_config.set_retry_attempts(3);
  store_config.set_retry_backoff_ms(50);

  auto store      = factory::BuildStore(store_config);
  auto applicator = std::make_shared<labels::KvApplicator>(store, 3);
  auto fake_rcs   = std::make_shared<rcstore::FakeStore>();
  auto kv_rcs     = std::make_shared<rcstore::KvStore>(store, applicator);

  MakeRc(*fake_rcs, "fake", manifest, flags.selector, pod_labels);
  const auto record = MakeRc(*kv_rcs, "coordination", manifest, flags.selector, pod_labels);

  // ------------------------------------------------------------
  // Scheduler
  // ------------------------------------------------------------
  std::shared_ptr<labels::Applicator> nodes = applicator;
  if (!flags.node_endpoint.empty()) {
    labels::HttpApplicatorOptions options;
    options.endpoint = flags.node_endpoint;
    options.headers  = flags.headers;
    nodes            = std::make_shared<labels::HttpApplicator>(std::move(options));
  } else {
    for (const auto& node : flags.local_nodes) {
      applicator->SetLabels(labels::EntityType::Node, node, LabelsFor(selector));
    }
  }
  auto scheduler = std::make_shared<rc::ApplicatorScheduler>(nodes);

  rc::ControllerOptions options;
  options.fallback_tick = std::chrono::milliseconds(1000);
  rc::ReplicationController controller(record, std::make_shared<kp::PodStore>(store), kv_rcs, scheduler, applicator, options);

  ORCHESTRATOR_LOG_INFO("RC labels", {StringField("rc", record.id()),
                                      IntField("count", static_cast<int64_t>(applicator->GetLabels(labels::EntityType::ReplicationController, record.id()).size()))});

  // ------------------------------------------------------------
  // Deploy
  // ------------------------------------------------------------
  auto tracker = std::make_shared<status::Tracker>();
  auto quit    = std::make_shared<runtime::QuitSignal>();
  auto errors  = controller.WatchDesires(quit);
  auto pump    = std::make_unique<rc::StatusPump>("rc/" + record.id(), errors, controller.Successes(), tracker, [](const rc::WatchError& error) {
    ORCHESTRATOR_LOG_WARN("Error from watcher", {StringField("error", error.String())});
  });

  ORCHESTRATOR_LOG_INFO("Deploying", {IntField("replicas", flags.nodes)});
  kv_rcs->SetDesiredReplicas(record.id(), flags.nodes);

  const auto wanted   = static_cast<size_t>(flags.nodes);
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(flags.timeout_s);
  if (flags.wait_watch) {
    const bool converged =
        controller.WaitForNodes([&](const std::vector<std::string>& current) { return current.size() == wanted; }, std::chrono::seconds(flags.timeout_s));
    if (!converged) Fatal("timed out waiting for " + std::to_string(wanted) + " nodes");
  } else {
    auto current = controller.CurrentNodes();
    while (current.size() != wanted) {
      if (std::chrono::steady_clock::now() > deadline) Fatal("timed out waiting for " + std::to_string(wanted) + " nodes");
      std::this_thread::sleep_for(std::chrono::milliseconds(flags.poll_ms));
      current = controller.CurrentNodes();
      ORCHESTRATOR_LOG_INFO("Currently on", {IntField("nodes", static_cast<int64_t>(current.size()))});
    }
  }
  for (const auto& node : controller.CurrentNodes()) {
    ORCHESTRATOR_LOG_INFO("Deployed", {StringField("node", node)});
  }

  // ------------------------------------------------------------
  // Teardown
  // ------------------------------------------------------------
  ORCHESTRATOR_LOG_INFO("Complete. Disabling the RC.");
  kv_rcs->Disable(record.id());

  try {
    kv_rcs->Delete(record.id());
    Fatal("Delete succeeded while replicas are desired, should have errored");
  } catch (const util::Conflict& e) {
    ORCHESTRATOR_LOG_INFO("Delete refused as expected", {StringField("error", e.what())});
  }

  kv_rcs->SetDesiredReplicas(record.id(), 0);
  kv_rcs->Delete(record.id());

  const auto residual = applicator->GetLabels(labels::EntityType::ReplicationController, record.id());
  if (!residual.empty()) {
    Fatal("RC still has " + std::to_string(residual.size()) + " labels after delete");
  }
  ORCHESTRATOR_LOG_INFO("RC labels after delete", {IntField("count", 0)});

  ORCHESTRATOR_LOG_INFO("Asking watcher to quit now.");
  quit->RequestAndWait();
  pump->Join();

  for (const auto& loop : tracker->Snapshot()) {
    ORCHESTRATOR_LOG_INFO("watch loop status", {StringField("loop", loop.name), IntField("consecutive_errors", static_cast<int64_t>(loop.consecutive_errors)),
                                                StringField("last_error", loop.last_error)});
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  runtime::config::RuntimeConfig config;
  observability::InitializeLogging(config);
  curl_global_init(CURL_GLOBAL_DEFAULT);

  int code = 0;
  try {
    code = Run(ParseFlags(argc, argv));
  } catch (const std::exception& e) {
    ORCHESTRATOR_LOG_ERROR("mini-orchestrator failed", {StringField("error", e.what())});
    code = 1;
  }

  curl_global_cleanup();
  observability::ShutdownLogging();
  return code;
}
