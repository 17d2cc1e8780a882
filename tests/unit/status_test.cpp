#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/rc/status_pump.hpp"
#include "internal/status/tracker.hpp"

namespace {

using orchestrator::rc::ReplicationController;
using orchestrator::rc::StatusPump;
using orchestrator::rc::TickReport;
using orchestrator::rc::WatchError;
using orchestrator::status::Tracker;

WatchError Error(uint64_t tick, const std::string& node) {
  WatchError error;
  error.kind    = WatchError::Kind::Placement;
  error.node    = node;
  error.message = "write failed";
  error.tick    = tick;
  return error;
}

void TestTrackerCountsAndResets() {
  Tracker tracker;
  assert(tracker.Get("rc/a").consecutive_errors == 0);

  tracker.RecordError("rc/a", "boom");
  tracker.RecordError("rc/a", "bang");
  assert(tracker.Get("rc/a").consecutive_errors == 2);
  assert(tracker.Get("rc/a").last_error == "bang");

  tracker.RecordSuccess("rc/a");
  const auto after = tracker.Get("rc/a");
  assert(after.consecutive_errors == 0);
  assert(after.last_error == "bang");
  assert(after.last_success_unix_ms > 0);

  tracker.RecordError("rc/b", "x");
  const auto snapshot = tracker.Snapshot();
  assert(snapshot.size() == 2);
  assert(snapshot[0].name == "rc/a");
  assert(snapshot[1].name == "rc/b");

  tracker.Forget("rc/b");
  assert(tracker.Snapshot().size() == 1);
}

void TestPumpOrdersByTick() {
  auto errors    = std::make_shared<ReplicationController::ErrorChannel>(16);
  auto successes = std::make_shared<ReplicationController::TickChannel>(16);
  auto tracker   = std::make_shared<Tracker>();

  std::vector<std::string> hooked;
  errors->Send(Error(1, "node-a"));
  errors->Send(Error(2, "node-b"));
  successes->Send(TickReport{3, {"node-a", "node-b"}});
  errors->Close();
  successes->Close();

  StatusPump pump("rc/x", errors, successes, tracker, [&](const WatchError& error) { hooked.push_back(error.node); });
  pump.Join();

  assert((hooked == std::vector<std::string>{"node-a", "node-b"}));
  const auto status = tracker->Get("rc/x");
  assert(status.consecutive_errors == 0);
  assert(status.last_error == "placement on node node-b: write failed");
  assert(status.last_success_unix_ms > 0);
}

void TestPumpKeepsCountWithoutSuccess() {
  auto errors    = std::make_shared<ReplicationController::ErrorChannel>(16);
  auto successes = std::make_shared<ReplicationController::TickChannel>(16);
  auto tracker   = std::make_shared<Tracker>();

  // a success from before the failures must not reset them
  successes->Send(TickReport{1, {}});
  errors->Send(Error(2, "node-a"));
  errors->Send(Error(3, "node-a"));
  errors->Close();
  successes->Close();

  StatusPump pump("rc/y", errors, successes, tracker);
  pump.Join();

  assert(tracker->Get("rc/y").consecutive_errors == 2);
}

} // namespace

int main() {
  TestTrackerCountsAndResets();
  TestPumpOrdersByTick();
  TestPumpKeepsCountWithoutSuccess();

  std::cout << "orchestrator_unit_status: pass\n";
  return 0;
}
