#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/kv/api/store.hpp"
#include "internal/rc/replication_controller.hpp"
#include "internal/rc/status_pump.hpp"
#include "internal/status/tracker.hpp"

namespace orchestrator::rc {

struct FarmOptions {
  std::string               name = "rc-farm";
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds session_ttl{15000};
  ControllerOptions         controller;
};

/*
  Runs one ReplicationController per RC record this process claims.

  A record is claimed by holding lock/replication_controllers/<id> under the
  farm's session, so several farms can share one store without two loops
  driving the same RC. Records that disappear get their loop stopped (quit +
  acknowledgement) and their lock released.
*/
class Farm {
 public:
  Farm(std::shared_ptr<kv::Store>          store,
       std::shared_ptr<kp::PodStore>       pods,
       std::shared_ptr<rcstore::Store>     rcs,
       std::shared_ptr<Scheduler>          scheduler,
       std::shared_ptr<labels::Applicator> applicator,
       std::shared_ptr<status::Tracker>    tracker,
       FarmOptions                         options = {});
  ~Farm();

  Farm(const Farm&)            = delete;
  Farm& operator=(const Farm&) = delete;

  void Start();

  // Cascades quit to every controller, awaits each acknowledgement, then
  // drops the session. Safe to call twice.
  void Stop();

  // One discovery pass. Start() runs this every poll_interval.
  void Sync();

  // ids of the controllers this farm runs, sorted
  std::vector<std::string> Running() const;

  // nullptr when this farm does not run the RC
  std::shared_ptr<ReplicationController> Controller(const std::string& id) const;

  static std::string LoopName(const std::string& rc_id) {
    return "rc/" + rc_id;
  }

 private:
  struct Child {
    std::shared_ptr<ReplicationController> controller;
    std::shared_ptr<runtime::QuitSignal>   quit;
    std::unique_ptr<StatusPump>            pump;
  };

  void Run();
  void EnsureSession();
  void Claim(const rcstore::RC& record);
  void StopChild(const std::string& id, Child& child, bool release_lock);

  std::shared_ptr<kv::Store>          store_;
  std::shared_ptr<kp::PodStore>       pods_;
  std::shared_ptr<rcstore::Store>     rcs_;
  std::shared_ptr<Scheduler>          scheduler_;
  std::shared_ptr<labels::Applicator> applicator_;
  std::shared_ptr<status::Tracker>    tracker_;
  FarmOptions                         options_;

  mutable std::mutex           mutex_; // guards children_ and session_
  std::map<std::string, Child> children_;
  std::string                  session_;

  std::mutex          sync_mutex_; // one Sync at a time
  runtime::QuitSignal quit_;
  std::thread         thread_;
  bool                stopped_ = false;
};

} // namespace orchestrator::rc
