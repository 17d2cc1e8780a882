#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/kp/pod_store.hpp"
#include "internal/labels/applicator.hpp"
#include "internal/rc/scheduler.hpp"
#include "internal/rcstore/store.hpp"
#include "internal/runtime/channel.hpp"
#include "internal/runtime/quit_signal.hpp"

namespace orchestrator::rc {

struct WatchError {
  enum class Kind {
    Record,     // could not read our own record; tick aborted
    Scheduling, // selector could not be resolved, or too few nodes
    Listing,    // could not read current placement; tick aborted
    Placement,  // one node failed to receive the pod
    Removal     // one node failed to drop the pod
  };

  Kind        kind = Kind::Record;
  std::string node;
  std::string message;
  uint64_t    tick = 0;

  std::string String() const;
};

const char* WatchErrorKindName(WatchError::Kind kind);

// Sent after every tick that reported no error.
struct TickReport {
  uint64_t                 tick = 0;
  std::vector<std::string> nodes;
};

struct ControllerOptions {
  // tick even when the record does not change, to pick up node label changes
  std::chrono::milliseconds fallback_tick{1000};

  // longest single blocking wait; quit is honored between slices
  std::chrono::milliseconds watch_slice{250};

  // session used for pod locks. Empty: the loop creates its own.
  std::string               lock_session;
  std::chrono::milliseconds session_ttl{15000};
};

/*
  Keeps one RC's placement converged with its desired replica count.

  Each tick:
    1. re-read the record (failure aborts the tick); disabled -> no actions
    2. target = first replicas_desired nodes the scheduler returns
    3. current = nodes of pod entities labeled replication_controller=<id>
    4. target \ current: write intent, then label the pod entity
    5. current \ target: under the pod lock, delete intent and labels

  Per-node failures go to the error channel and never stop other nodes or
  the loop. Only the quit signal ends the loop, which acknowledges it last.
*/
class ReplicationController {
 public:
  using ErrorChannel = runtime::Channel<WatchError>;
  using TickChannel  = runtime::Channel<TickReport>;

  ReplicationController(rcstore::RC                         record,
                        std::shared_ptr<kp::PodStore>       pods,
                        std::shared_ptr<rcstore::Store>     rcs,
                        std::shared_ptr<Scheduler>          scheduler,
                        std::shared_ptr<labels::Applicator> applicator,
                        ControllerOptions                   options = {});
  ~ReplicationController();

  ReplicationController(const ReplicationController&)            = delete;
  ReplicationController& operator=(const ReplicationController&) = delete;

  // Starts the background loop. One loop per controller.
  std::shared_ptr<ErrorChannel> WatchDesires(std::shared_ptr<runtime::QuitSignal> quit);

  // Error-free tick notifications; closed when the loop exits.
  std::shared_ptr<TickChannel> Successes() const {
    return successes_;
  }

  // Sorted nodes holding a pod owned by this RC.
  std::vector<std::string> CurrentNodes();

  /*
    Blocks on label change notifications until predicate(CurrentNodes())
    holds. false on timeout or when cancel is requested first.
  */
  bool WaitForNodes(const std::function<bool(const std::vector<std::string>&)>& predicate,
                    std::chrono::milliseconds                                   timeout,
                    const runtime::QuitSignal*                                  cancel = nullptr);

  const std::string& ID() const {
    return id_;
  }

  // last record observed by the loop
  rcstore::RC Record() const;

 private:
  void Run(std::shared_ptr<runtime::QuitSignal> quit, std::shared_ptr<ErrorChannel> errors);
  bool Tick(ErrorChannel& errors);
  void Report(ErrorChannel& errors, WatchError error);

  // node -> pod entity id
  std::vector<std::pair<std::string, std::string>> OwnedPods();

  void Place(const rcstore::RC& record, const std::string& node);
  void Remove(const std::string& node, const std::string& entity_id);

  const std::string& LockSession();

  std::string                         id_;
  std::shared_ptr<kp::PodStore>       pods_;
  std::shared_ptr<rcstore::Store>     rcs_;
  std::shared_ptr<Scheduler>          scheduler_;
  std::shared_ptr<labels::Applicator> applicator_;
  ControllerOptions                   options_;

  mutable std::mutex mutex_;
  rcstore::RC        record_;

  std::string own_session_;
  uint64_t    ticks_ = 0;

  std::shared_ptr<TickChannel>         successes_;
  std::shared_ptr<runtime::QuitSignal> quit_;
  std::thread                          thread_;
  std::atomic<bool>                    started_{false};
};

} // namespace orchestrator::rc
