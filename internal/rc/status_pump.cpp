#include "status_pump.hpp"

namespace orchestrator::rc {

StatusPump::StatusPump(std::string                                          loop,
                       std::shared_ptr<ReplicationController::ErrorChannel> errors,
                       std::shared_ptr<ReplicationController::TickChannel>  successes,
                       std::shared_ptr<status::Tracker>                     tracker,
                       ErrorHook                                            on_error)
    : loop_(std::move(loop)),
      errors_(std::move(errors)),
      successes_(std::move(successes)),
      tracker_(std::move(tracker)),
      on_error_(std::move(on_error)) {
  thread_ = std::thread(&StatusPump::Run, this);
}

StatusPump::~StatusPump() {
  Join();
}

void StatusPump::Join() {
  if (thread_.joinable()) thread_.join();
}

void StatusPump::Run() {
  uint64_t last_error_tick   = 0;
  uint64_t last_success_tick = 0;

  auto record_error = [&](const WatchError& error) {
    if (on_error_) on_error_(error);
    if (error.tick < last_success_tick) return;
    last_error_tick = error.tick;
    tracker_->RecordError(loop_, error.String());
  };

  while (!(errors_->Drained() && successes_->Drained())) {
    if (auto error = errors_->ReceiveFor(std::chrono::milliseconds(100))) {
      record_error(*error);
    }
    while (auto error = errors_->TryReceive()) {
      record_error(*error);
    }
    while (auto report = successes_->TryReceive()) {
      if (report->tick <= last_error_tick) continue;
      last_success_tick = report->tick;
      tracker_->RecordSuccess(loop_);
    }
  }
}

} // namespace orchestrator::rc
