#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "internal/rc/replication_controller.hpp"
#include "internal/status/tracker.hpp"

namespace orchestrator::rc {

/*
  Drains one controller's error and success channels into the status
  tracker. Exits once both channels are closed and empty, which happens when
  the controller's loop acknowledges quit.

  Ticks order the two channels: an error older than the newest recorded
  success is stale and does not count, and a success older than the newest
  error does not reset.
*/
class StatusPump {
 public:
  using ErrorHook = std::function<void(const WatchError&)>;

  StatusPump(std::string                                          loop,
             std::shared_ptr<ReplicationController::ErrorChannel> errors,
             std::shared_ptr<ReplicationController::TickChannel>  successes,
             std::shared_ptr<status::Tracker>                     tracker,
             ErrorHook                                            on_error = {});
  ~StatusPump();

  StatusPump(const StatusPump&)            = delete;
  StatusPump& operator=(const StatusPump&) = delete;

  // Blocks until the channels are closed and drained.
  void Join();

 private:
  void Run();

  std::string                                          loop_;
  std::shared_ptr<ReplicationController::ErrorChannel> errors_;
  std::shared_ptr<ReplicationController::TickChannel>  successes_;
  std::shared_ptr<status::Tracker>                     tracker_;
  ErrorHook                                            on_error_;
  std::thread                                          thread_;
};

} // namespace orchestrator::rc
