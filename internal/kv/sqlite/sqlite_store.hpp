#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include "internal/kv/api/store.hpp"
#include "sqlite_db.hpp"

namespace orchestrator::kv::sqlite {

/*
  Durable coordination store on a single SQLite file.

  Several processes on one host may open the same file: writes are
  serialized by BEGIN IMMEDIATE, the store-wide index lives in a one-row
  table, and watches poll that index because SQLite has no change feed.

  Tombstones are bounded the same way as in memory::MemoryStore: evicting
  the oldest raises the compaction floor kept in kv_compacted.
*/
class SqliteStore final : public kv::Store {
 public:
  static constexpr uint64_t kDefaultMaxTombstones = 4096;

  explicit SqliteStore(std::shared_ptr<SqliteDB>  db,
                       std::chrono::milliseconds poll_interval  = std::chrono::milliseconds(50),
                       uint64_t                  max_tombstones = kDefaultMaxTombstones);

  // Creates tables if missing.
  void Bootstrap();

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

  uint64_t TombstoneCount();

 private:
  static Result Translate(const SqliteError& e);

  // Runs fn inside BEGIN IMMEDIATE; commits only when fn returns Ok.
  Result Write(const std::function<Result()>& fn);

  uint64_t              NextIndex();
  uint64_t              PrefixIndex(const std::string& prefix);
  std::optional<KVPair> Lookup(const std::string& key);
  void                  Upsert(const std::string& key, const std::string& value, const std::string& session, uint64_t create_index);
  void                  Erase(const std::string& key);
  uint64_t              CountTombstones();
  void                  CompactTombstones();
  void                  ExpireSessions();
  void                  DropSession(const std::string& session);
  bool                  SessionAlive(const std::string& session);

  std::shared_ptr<SqliteDB> db_;
  std::chrono::milliseconds poll_interval_;
  uint64_t                  max_tombstones_;

  // one connection: transactions must not interleave between threads
  std::mutex mutex_;
};

} // namespace orchestrator::kv::sqlite
