#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/kv/memory/memory_store.hpp"
#include "internal/labels/fake_applicator.hpp"
#include "internal/labels/http_applicator.hpp"
#include "internal/labels/kv_applicator.hpp"
#include "internal/runtime/quit_signal.hpp"
#include "internal/util/errors.hpp"

namespace {

using orchestrator::labels::Applicator;
using orchestrator::labels::EntityType;
using orchestrator::labels::Labeled;
using orchestrator::labels::Labels;
using orchestrator::labels::Selector;

// Behaviour every writable applicator shares.
void CheckContract(Applicator& applicator) {
  assert(applicator.GetLabels(EntityType::Node, "unknown").empty());

  applicator.SetLabels(EntityType::Node, "node-b", {{"role", "web"}, {"zone", "a"}});
  applicator.SetLabels(EntityType::Node, "node-a", {{"role", "web"}});
  applicator.SetLabel(EntityType::Node, "node-c", "role", "db");

  // merge, last write wins per key
  applicator.SetLabels(EntityType::Node, "node-b", {{"zone", "b"}});
  assert((applicator.GetLabels(EntityType::Node, "node-b") == Labels{{"role", "web"}, {"zone", "b"}}));

  const auto web = applicator.GetMatches(Selector::Parse("role=web"), EntityType::Node);
  assert(web.size() == 2);
  assert(web[0].id == "node-a");
  assert(web[1].id == "node-b");
  assert(web[1].type == EntityType::Node);

  // types are separate namespaces
  assert(applicator.GetMatches(Selector::Parse("role=web"), EntityType::Pod).empty());
  assert(applicator.GetLabels(EntityType::Pod, "node-a").empty());

  applicator.RemoveLabels(EntityType::Node, "node-b", {"zone", "missing"});
  assert((applicator.GetLabels(EntityType::Node, "node-b") == Labels{{"role", "web"}}));

  applicator.RemoveAllLabels(EntityType::Node, "node-a");
  applicator.RemoveAllLabels(EntityType::Node, "node-a");
  assert(applicator.GetLabels(EntityType::Node, "node-a").empty());
  assert(applicator.GetMatches(Selector::Everything(), EntityType::Node).size() == 2);

  // removing the last key drops the entity
  applicator.RemoveLabels(EntityType::Node, "node-c", {"role"});
  assert(applicator.GetMatches(Selector::Everything(), EntityType::Node).size() == 1);
}

void CheckWatch(Applicator& applicator) {
  applicator.SetWatchSlice(std::chrono::milliseconds(20));

  orchestrator::runtime::QuitSignal     cancel;
  std::mutex                            mutex;
  std::vector<std::vector<Labeled>>     snapshots;

  std::thread watcher([&] {
    applicator.WatchMatches(Selector::Parse("replication_controller=rc-1"), EntityType::Pod, cancel, [&](const std::vector<Labeled>& matches) {
      std::lock_guard lock(mutex);
      snapshots.push_back(matches);
      if (matches.size() == 2) cancel.Request();
    });
  });

  applicator.SetLabels(EntityType::Pod, "node-1/hello", {{"replication_controller", "rc-1"}});
  // an unrelated change must not produce a duplicate snapshot
  applicator.SetLabels(EntityType::Pod, "node-9/other", {{"replication_controller", "rc-2"}});
  applicator.SetLabels(EntityType::Pod, "node-2/hello", {{"replication_controller", "rc-1"}});

  watcher.join();

  std::lock_guard lock(mutex);
  assert(!snapshots.empty());
  assert(snapshots.back().size() == 2);
  for (size_t i = 1; i < snapshots.size(); ++i) {
    assert(snapshots[i] != snapshots[i - 1]);
  }
}

void TestFakeApplicator() {
  orchestrator::labels::FakeApplicator applicator;
  CheckContract(applicator);
  CheckWatch(applicator);
  assert(!applicator.All().empty());
}

void TestKvApplicator() {
  auto store = std::make_shared<orchestrator::kv::memory::MemoryStore>();
  orchestrator::labels::KvApplicator applicator(store);
  CheckContract(applicator);
  CheckWatch(applicator);

  assert(store->Get("labels/pod/node-1/hello"));
  applicator.RemoveAllLabels(EntityType::Pod, "node-1/hello");
  assert(!store->Get("labels/pod/node-1/hello"));

  bool threw = false;
  try {
    applicator.SetLabel(EntityType::Node, "", "k", "v");
  } catch (const orchestrator::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestEntityTypeNames() {
  for (auto type : {EntityType::Pod, EntityType::Node, EntityType::ReplicationController}) {
    assert(orchestrator::labels::ParseEntityType(orchestrator::labels::EntityTypeName(type)) == type);
  }
}

void TestHttpResponseParsing() {
  const auto matches = orchestrator::labels::HttpApplicator::ParseMatches(
      R"({"matches":[{"id":"node-2","labels":{"role":"web"}},{"id":"","labels":{}},{"id":"node-1","labels":{"role":"web","zone":"a"}}],"total":2})",
      EntityType::Node);

  assert(matches.size() == 2);
  assert(matches[0].id == "node-2");
  assert(matches[1].labels.at("zone") == "a");
  assert(orchestrator::labels::HttpApplicator::ParseMatches("{}", EntityType::Node).empty());

  bool threw = false;
  try {
    orchestrator::labels::HttpApplicator::ParseMatches("<html>", EntityType::Node);
  } catch (const orchestrator::util::SchedulingError&) {
    threw = true;
  }
  assert(threw);
}

void TestHttpApplicatorIsReadOnly() {
  orchestrator::labels::HttpApplicatorOptions options;
  options.endpoint = "http://127.0.0.1:9/nodes";
  orchestrator::labels::HttpApplicator applicator(options);

  bool threw = false;
  try {
    applicator.SetLabel(EntityType::Node, "node-1", "k", "v");
  } catch (const orchestrator::util::Unsupported&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    orchestrator::labels::HttpApplicator unconfigured(orchestrator::labels::HttpApplicatorOptions{});
  } catch (const orchestrator::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFakeApplicator();
  TestKvApplicator();
  TestEntityTypeNames();
  TestHttpResponseParsing();
  TestHttpApplicatorIsReadOnly();

  std::cout << "orchestrator_unit_applicator: pass\n";
  return 0;
}
