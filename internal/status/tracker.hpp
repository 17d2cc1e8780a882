#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace orchestrator::status {

struct LoopStatus {
  std::string name;
  uint64_t    consecutive_errors = 0;
  std::string last_error;
  uint64_t    last_success_unix_ms = 0;
};

/*
  Process-wide consecutive-error counters keyed by watch loop name.

  Fed only from the loops' channels; the loops themselves never read it.
  A success resets the counter but keeps the last error text.
*/
class Tracker {
 public:
  void RecordError(const std::string& loop, const std::string& error);
  void RecordSuccess(const std::string& loop);

  // Drops a loop that no longer runs.
  void Forget(const std::string& loop);

  // sorted by name
  std::vector<LoopStatus> Snapshot() const;

  LoopStatus Get(const std::string& loop) const;

 private:
  mutable std::mutex                mutex_;
  std::map<std::string, LoopStatus> loops_;
};

} // namespace orchestrator::status
