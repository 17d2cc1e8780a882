#include "internal/rc/farm.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/kp/manifest.hpp"
#include "internal/kv/memory/memory_store.hpp"
#include "internal/labels/fake_applicator.hpp"
#include "internal/rcstore/kv_store.hpp"

namespace {

using namespace std::chrono_literals;
using orchestrator::labels::EntityType;
using orchestrator::rc::Farm;
using orchestrator::rc::FarmOptions;

struct Cluster {
  std::shared_ptr<orchestrator::kv::memory::MemoryStore> store      = std::make_shared<orchestrator::kv::memory::MemoryStore>();
  std::shared_ptr<orchestrator::kp::PodStore>            pods       = std::make_shared<orchestrator::kp::PodStore>(store);
  std::shared_ptr<orchestrator::labels::FakeApplicator>  applicator = std::make_shared<orchestrator::labels::FakeApplicator>();
  std::shared_ptr<orchestrator::rcstore::KvStore>        rcs        = std::make_shared<orchestrator::rcstore::KvStore>(store, applicator);
  std::shared_ptr<orchestrator::rc::Scheduler>           scheduler  = std::make_shared<orchestrator::rc::ApplicatorScheduler>(applicator);
  std::shared_ptr<orchestrator::status::Tracker>         tracker    = std::make_shared<orchestrator::status::Tracker>();

  Cluster() {
    applicator->SetLabels(EntityType::Node, "node-a", {{"role", "web"}});
    applicator->SetLabels(EntityType::Node, "node-b", {{"role", "web"}});
  }

  std::unique_ptr<Farm> NewFarm(const std::string& name, std::chrono::milliseconds poll = 1000ms) {
    FarmOptions options;
    options.name                     = name;
    options.poll_interval            = poll;
    options.controller.fallback_tick = 50ms;
    options.controller.watch_slice   = 10ms;
    return std::make_unique<Farm>(store, pods, rcs, scheduler, applicator, tracker, options);
  }
};

void TestOneFarmPerRecord() {
  Cluster    cluster;
  const auto rc = cluster.rcs->Create(orchestrator::kp::ParseManifest("id: hello\n"), "role=web", {});

  auto first  = cluster.NewFarm("farm-1");
  auto second = cluster.NewFarm("farm-2");

  first->Sync();
  second->Sync();
  assert((first->Running() == std::vector<std::string>{rc.id()}));
  assert(second->Running().empty());
  assert(!second->Controller(rc.id()));
  assert(cluster.store->Get("lock/replication_controllers/" + rc.id()));

  cluster.rcs->SetDesiredReplicas(rc.id(), 2);
  auto controller = first->Controller(rc.id());
  assert(controller);
  assert(controller->WaitForNodes([](const std::vector<std::string>& nodes) { return nodes.size() == 2; }, 5s));

  // the claim moves once its holder stops
  first->Stop();
  first->Stop();
  assert(first->Running().empty());
  second->Sync();
  assert((second->Running() == std::vector<std::string>{rc.id()}));
  assert(cluster.tracker->Get("farm-2").consecutive_errors == 0);

  // removed records lose their loop and their claim
  cluster.rcs->SetDesiredReplicas(rc.id(), 0);
  cluster.rcs->Delete(rc.id());
  second->Sync();
  assert(second->Running().empty());
  assert(!cluster.store->Get("lock/replication_controllers/" + rc.id()));
  for (const auto& loop : cluster.tracker->Snapshot()) {
    assert(loop.name != Farm::LoopName(rc.id()));
  }
  second->Stop();
}

void TestBackgroundLoopPicksUpNewRecords() {
  Cluster cluster;
  auto    farm = cluster.NewFarm("farm-bg", 20ms);
  farm->Start();

  const auto rc = cluster.rcs->Create(orchestrator::kp::ParseManifest("id: later\n"), "role=web", {});
  cluster.rcs->SetDesiredReplicas(rc.id(), 1);

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (farm->Running().empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  assert(!farm->Running().empty());

  auto controller = farm->Controller(rc.id());
  assert(controller->WaitForNodes([](const std::vector<std::string>& nodes) { return nodes.size() == 1; }, 5s));

  farm->Stop();
  assert(farm->Running().empty());
  // the farm's session is gone, so its claim is too
  assert(!cluster.store->Get("lock/replication_controllers/" + rc.id()));
}

} // namespace

int main() {
  TestOneFarmPerRecord();
  TestBackgroundLoopPicksUpNewRecords();

  std::cout << "orchestrator_unit_farm: pass\n";
  return 0;
}
