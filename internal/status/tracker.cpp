#include "tracker.hpp"

#include "internal/util/time.hpp"

namespace orchestrator::status {

void Tracker::RecordError(const std::string& loop, const std::string& error) {
  std::lock_guard lock(mutex_);
  auto&           status = loops_[loop];
  status.name            = loop;
  status.consecutive_errors++;
  status.last_error = error;
}

void Tracker::RecordSuccess(const std::string& loop) {
  std::lock_guard lock(mutex_);
  auto&           status      = loops_[loop];
  status.name                 = loop;
  status.consecutive_errors   = 0;
  status.last_success_unix_ms = util::NowMillis();
}

void Tracker::Forget(const std::string& loop) {
  std::lock_guard lock(mutex_);
  loops_.erase(loop);
}

std::vector<LoopStatus> Tracker::Snapshot() const {
  std::lock_guard         lock(mutex_);
  std::vector<LoopStatus> out;
  out.reserve(loops_.size());
  for (const auto& [name, status] : loops_) {
    out.push_back(status);
  }
  return out;
}

LoopStatus Tracker::Get(const std::string& loop) const {
  std::lock_guard lock(mutex_);
  auto            it = loops_.find(loop);
  if (it == loops_.end()) return {loop, 0, {}, 0};
  return it->second;
}

} // namespace orchestrator::status
