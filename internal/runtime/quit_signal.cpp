#include "quit_signal.hpp"

namespace orchestrator::runtime {

void QuitSignal::Request() {
  {
    std::lock_guard lock(mutex_);
    requested_ = true;
  }
  cv_.notify_all();
}

bool QuitSignal::IsRequested() const {
  std::lock_guard lock(mutex_);
  return requested_;
}

bool QuitSignal::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return requested_; });
}

void QuitSignal::Acknowledge() {
  {
    std::lock_guard lock(mutex_);
    acknowledged_ = true;
  }
  cv_.notify_all();
}

bool QuitSignal::IsAcknowledged() const {
  std::lock_guard lock(mutex_);
  return acknowledged_;
}

void QuitSignal::AwaitAcknowledgement() const {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return acknowledged_; });
}

bool QuitSignal::AwaitAcknowledgementFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return acknowledged_; });
}

void QuitSignal::RequestAndWait() {
  Request();
  AwaitAcknowledgement();
}

} // namespace orchestrator::runtime
