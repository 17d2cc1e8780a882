#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/kp/manifest.hpp"
#include "internal/kp/pod_store.hpp"
#include "internal/kv/memory/memory_store.hpp"
#include "internal/labels/fake_applicator.hpp"
#include "internal/rc/ownership.hpp"
#include "internal/rcstore/fake_store.hpp"
#include "internal/rcstore/kv_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using google::protobuf::util::MessageDifferencer;
using orchestrator::labels::EntityType;
using orchestrator::rcstore::RC;
using orchestrator::rcstore::Store;

const orchestrator::v1::PodManifest& Manifest() {
  static const auto manifest = orchestrator::kp::ParseManifest("id: hello\nconfig:\n  port: 8080\n");
  return manifest;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

size_t ListCount(Store& store, const std::string& id) {
  const auto all = store.List();
  return std::count_if(all.begin(), all.end(), [&](const RC& rc) { return rc.id() == id; });
}

void CheckCreateAndRoundTrip(Store& store) {
  const auto created = store.Create(Manifest(), "role = web, zone in (b, a)", {{"app", "hello"}});

  assert(!created.id().empty());
  assert(created.replicas_desired() == 0);
  assert(!created.disabled());
  assert(created.node_selector() == "role=web,zone in (a,b)");

  const auto read = store.Get(created.id());
  assert(MessageDifferencer::Equals(created, read));
  assert(ListCount(store, created.id()) == 1);

  const auto other = store.Create(Manifest(), "role=web", {});
  assert(other.id() != created.id());
}

void CheckCreateValidation(Store& store) {
  const auto before = store.List().size();

  orchestrator::v1::PodManifest no_id;
  no_id.set_raw_yaml("config: {}\n");
  assert(Throws<orchestrator::util::InvalidArgument>([&] { store.Create(no_id, "", {}); }));
  assert(Throws<orchestrator::util::InvalidArgument>([&] { store.Create(Manifest(), "role in (web", {}); }));
  assert(Throws<orchestrator::util::InvalidArgument>([&] { store.Create(Manifest(), "", {{"", "x"}}); }));

  assert(store.List().size() == before);
}

void CheckUnknownIdChangesNothing(Store& store) {
  const auto before = store.List().size();

  assert(Throws<orchestrator::util::NotFound>([&] { store.Get("BOGUSBOGUS"); }));
  assert(Throws<orchestrator::util::NotFound>([&] { store.SetDesiredReplicas("BOGUSBOGUS", 1); }));
  assert(Throws<orchestrator::util::NotFound>([&] { store.Disable("BOGUSBOGUS"); }));
  assert(Throws<orchestrator::util::NotFound>([&] { store.Delete("BOGUSBOGUS"); }));

  assert(store.List().size() == before);
}

void CheckReplicasDisableDelete(Store& store) {
  const auto rc = store.Create(Manifest(), "role=web", {});

  assert(Throws<orchestrator::util::InvalidArgument>([&] { store.SetDesiredReplicas(rc.id(), -1); }));
  assert(store.Get(rc.id()).replicas_desired() == 0);

  store.SetDesiredReplicas(rc.id(), 3);
  assert(store.Get(rc.id()).replicas_desired() == 3);

  store.Disable(rc.id());
  store.Disable(rc.id());
  const auto disabled = store.Get(rc.id());
  assert(disabled.disabled());
  assert(disabled.replicas_desired() == 3);

  // delete is refused while replicas are wanted and leaves the record alone
  assert(Throws<orchestrator::util::Conflict>([&] { store.Delete(rc.id()); }));
  assert(MessageDifferencer::Equals(disabled, store.Get(rc.id())));

  store.SetDesiredReplicas(rc.id(), 0);
  store.Delete(rc.id());
  assert(Throws<orchestrator::util::NotFound>([&] { store.Get(rc.id()); }));
  assert(ListCount(store, rc.id()) == 0);
  assert(Throws<orchestrator::util::NotFound>([&] { store.Delete(rc.id()); }));
}

void CheckConcurrentUpdatesSerialize(Store& store) {
  const auto rc = store.Create(Manifest(), "role=web", {});

  std::atomic<int>         failures{0};
  std::vector<std::thread> writers;
  for (int i = 1; i <= 8; ++i) {
    writers.emplace_back([&, i] {
      try {
        store.SetDesiredReplicas(rc.id(), i);
        if (i % 2 == 0) store.Disable(rc.id());
      } catch (const std::exception&) {
        failures++;
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(failures == 0);
  const auto final = store.Get(rc.id());
  assert(final.replicas_desired() >= 1 && final.replicas_desired() <= 8);
  // the disable from an even writer survived every replica update
  assert(final.disabled());
}

void CheckWaitForChange(Store& store) {
  const auto rc    = store.Create(Manifest(), "role=web", {});
  const auto token = store.WaitForChange(rc.id(), 0, std::chrono::milliseconds(0));
  assert(token > 0);
  assert(store.WaitForChange(rc.id(), token, std::chrono::milliseconds(10)) == token);

  std::thread writer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    store.SetDesiredReplicas(rc.id(), 2);
  });
  const auto next = store.WaitForChange(rc.id(), token, std::chrono::seconds(5));
  writer.join();
  assert(next != token);
}

void CheckStore(Store& store) {
  CheckCreateAndRoundTrip(store);
  CheckCreateValidation(store);
  CheckUnknownIdChangesNothing(store);
  CheckReplicasDisableDelete(store);
  CheckConcurrentUpdatesSerialize(store);
  CheckWaitForChange(store);
}

void TestFakeStore() {
  orchestrator::rcstore::FakeStore store;
  CheckStore(store);
}

void TestKvStore() {
  auto                             kv = std::make_shared<orchestrator::kv::memory::MemoryStore>();
  orchestrator::rcstore::KvStore store(kv, std::make_shared<orchestrator::labels::FakeApplicator>());
  CheckStore(store);
}

void TestKvStoreLabels() {
  auto kv         = std::make_shared<orchestrator::kv::memory::MemoryStore>();
  auto applicator = std::make_shared<orchestrator::labels::FakeApplicator>();

  orchestrator::rcstore::KvStore store(kv, applicator);
  const auto                     rc = store.Create(Manifest(), "role=web", {});
  assert(applicator->GetLabels(EntityType::ReplicationController, rc.id()).at("pod_id") == "hello");
  assert(kv->Get(orchestrator::rcstore::KvStore::RecordKey(rc.id())));

  // a placement made by the controller, plus an unrelated pod
  orchestrator::kp::PodStore pods(kv);
  pods.SetPod(orchestrator::kp::Tree::Intent, "node-1", Manifest());
  applicator->SetLabels(EntityType::Pod, "node-1/hello", {{orchestrator::rc::kOwnerLabel, rc.id()}, {"app", "hello"}});
  assert(kv->Put({"intent/node-1/other", "id: other\n"}));
  applicator->SetLabels(EntityType::Pod, "node-1/other", {{orchestrator::rc::kOwnerLabel, "someone-else"}});

  store.Delete(rc.id());
  assert(applicator->GetLabels(EntityType::ReplicationController, rc.id()).empty());
  assert(applicator->GetLabels(EntityType::Pod, "node-1/hello").empty());
  assert(!applicator->GetLabels(EntityType::Pod, "node-1/other").empty());
  assert(!kv->Get(orchestrator::rcstore::KvStore::RecordKey(rc.id())));

  // placements go with their controller; nothing else does
  assert(!kv->Get("intent/node-1/hello"));
  assert(kv->Get("intent/node-1/other"));
  assert(!kv->Get("lock/intent/node-1/hello"));
}

void TestKvStoreDeleteSkipsPlacementBeingRemoved() {
  auto kv         = std::make_shared<orchestrator::kv::memory::MemoryStore>();
  auto applicator = std::make_shared<orchestrator::labels::FakeApplicator>();

  orchestrator::rcstore::KvStore store(kv, applicator);
  const auto                     rc = store.Create(Manifest(), "role=web", {});

  orchestrator::kp::PodStore pods(kv);
  for (const auto* node : {"node-1", "node-2"}) {
    pods.SetPod(orchestrator::kp::Tree::Intent, node, Manifest());
    applicator->SetLabel(EntityType::Pod, orchestrator::rc::PodEntityId(node, "hello"), orchestrator::rc::kOwnerLabel, rc.id());
  }

  // a controller is unscheduling node-2 right now
  const auto remover = kv->CreateSession("rc/" + rc.id(), std::chrono::seconds(30));
  assert(kv->Acquire("lock/intent/node-2/hello", remover));

  store.Delete(rc.id());
  assert(!kv->Get("intent/node-1/hello"));
  assert(applicator->GetLabels(EntityType::Pod, "node-1/hello").empty());
  assert(kv->Get("intent/node-2/hello"));
  assert(kv->Get("lock/intent/node-2/hello")->session == remover);
  assert(kv->DestroySession(remover));
}

void TestEmptyIdIsNotFound() {
  orchestrator::rcstore::FakeStore fake;
  auto                             kv = std::make_shared<orchestrator::kv::memory::MemoryStore>();
  orchestrator::rcstore::KvStore   backed(kv);

  for (Store* store : {static_cast<Store*>(&fake), static_cast<Store*>(&backed)}) {
    assert(Throws<orchestrator::util::NotFound>([&] { store->Get(""); }));
    assert(Throws<orchestrator::util::NotFound>([&] { store->SetDesiredReplicas("", 1); }));
    assert(Throws<orchestrator::util::NotFound>([&] { store->Disable(""); }));
    assert(Throws<orchestrator::util::NotFound>([&] { store->Delete(""); }));
  }
}

void TestFakeWaitOnUnknownIdTracksNothing() {
  orchestrator::rcstore::FakeStore store;
  assert(store.WaitForChange("BOGUSBOGUS", 0, std::chrono::milliseconds(0)) == 0);
  assert(store.TrackedVersions() == 0);

  const auto rc = store.Create(Manifest(), "role=web", {});
  for (int i = 0; i < 50; ++i) {
    store.WaitForChange("missing-" + std::to_string(i), 0, std::chrono::milliseconds(0));
  }
  assert(store.TrackedVersions() == 1);
  assert(store.WaitForChange(rc.id(), 0, std::chrono::milliseconds(0)) > 0);
}

} // namespace

int main() {
  TestFakeStore();
  TestKvStore();
  TestKvStoreLabels();
  TestKvStoreDeleteSkipsPlacementBeingRemoved();
  TestEmptyIdIsNotFound();
  TestFakeWaitOnUnknownIdTracksNothing();

  std::cout << "orchestrator_unit_rcstore: pass\n";
  return 0;
}
