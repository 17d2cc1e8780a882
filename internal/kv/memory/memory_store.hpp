#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

#include "internal/kv/api/store.hpp"

namespace orchestrator::kv::memory {

/*
  Process-local coordination store.

  Used by tests, dry runs and single-process deployments. All state lives
  behind one mutex; watches park on a condition variable that every write
  notifies.

  Deletes leave a tombstone so prefix watches see them. At most
  max_tombstones are kept; evicting one raises a compaction floor that every
  prefix index reports, so a watcher older than the floor wakes up instead
  of missing the delete.
*/
class MemoryStore final : public kv::Store {
 public:
  static constexpr size_t kDefaultMaxTombstones = 4096;

  explicit MemoryStore(size_t max_tombstones = kDefaultMaxTombstones);

  std::optional<KVPair> Get(const std::string& key) override;
  std::vector<KVPair>   List(const std::string& prefix) override;
  uint64_t              WaitIndex(const std::string& prefix, uint64_t after_index, std::chrono::milliseconds timeout) override;

  Result Put(const KVPair& pair) override;
  Result CheckAndSet(const KVPair& pair) override;
  Result Delete(const std::string& key) override;
  Result DeleteCheckAndSet(const std::string& key, uint64_t modify_index) override;

  std::string CreateSession(const std::string& name, std::chrono::milliseconds ttl) override;
  Result      RenewSession(const std::string& session) override;
  Result      DestroySession(const std::string& session) override;
  Result      Acquire(const std::string& key, const std::string& session) override;
  Result      Release(const std::string& key, const std::string& session) override;

  size_t TombstoneCount();

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::string value;
    uint64_t    create_index = 0;
    uint64_t    modify_index = 0;
    std::string session;
  };

  struct Session {
    std::string               name;
    std::chrono::milliseconds ttl{0};
    Clock::time_point         expires_at;
    std::set<std::string>     held;
  };

  static KVPair ToPair(const std::string& key, const Entry& entry);

  void     WriteLocked(const std::string& key, const std::string& value, const std::string& session);
  void     EraseLocked(const std::string& key);
  void     ForgetTombstoneLocked(const std::string& key);
  void     ExpireSessionsLocked();
  void     DropSessionLocked(const std::string& session);
  uint64_t PrefixIndexLocked(const std::string& prefix) const;

  std::mutex              mutex_;
  std::condition_variable changed_;

  std::map<std::string, Entry>             entries_;
  std::map<std::string, uint64_t>          tombstones_;
  std::map<uint64_t, std::string>          tombstones_by_index_;
  std::unordered_map<std::string, Session> sessions_;

  size_t   max_tombstones_;
  uint64_t index_           = 0;
  uint64_t compacted_index_ = 0;
};

} // namespace orchestrator::kv::memory
