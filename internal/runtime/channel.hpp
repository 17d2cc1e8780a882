#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace orchestrator::runtime {

/*
  Thread-safe blocking hand-off between a background loop and its readers.

  capacity == 0 means unbounded. A bounded channel drops its oldest value
  when full so a sender never blocks on a reader that went away.
  Receive returns nullopt once the channel is closed and drained.
*/
template <typename T>
class Channel {
 public:
  explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {
  }

  // false if the channel is closed
  bool Send(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) return false;
      if (capacity_ > 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  // blocking wait
  std::optional<T> Receive() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });
    return PopLocked();
  }

  std::optional<T> ReceiveFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });
    return PopLocked();
  }

  std::optional<T> TryReceive() {
    std::lock_guard lock(mutex_);
    return PopLocked();
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  // closed and nothing left to read
  bool Drained() const {
    std::lock_guard lock(mutex_);
    return closed_ && queue_.empty();
  }

  std::size_t Dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  std::optional<T> PopLocked() {
    if (queue_.empty()) return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<T>           queue_;
  std::size_t             capacity_ = 0;
  std::size_t             dropped_  = 0;
  bool                    closed_   = false;
};

} // namespace orchestrator::runtime
