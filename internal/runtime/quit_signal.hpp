#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace orchestrator::runtime {

/*
  Cancellation token plus acknowledgement.

  The requester calls Request() and then AwaitAcknowledgement(); the loop
  checks IsRequested() (or sleeps in WaitFor) and calls Acknowledge() as the
  last thing it does, so nothing it writes can happen after the requester
  resumes.
*/
class QuitSignal {
 public:
  void Request();
  bool IsRequested() const;

  // Sleeps up to timeout. true if quit was requested.
  bool WaitFor(std::chrono::milliseconds timeout) const;

  void Acknowledge();
  bool IsAcknowledged() const;

  void AwaitAcknowledgement() const;
  bool AwaitAcknowledgementFor(std::chrono::milliseconds timeout) const;

  // Request() + AwaitAcknowledgement()
  void RequestAndWait();

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            requested_    = false;
  bool                            acknowledged_ = false;
};

} // namespace orchestrator::runtime
