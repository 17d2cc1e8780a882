#include "memory_store.hpp"

#include <algorithm>
#include <vector>

#include "internal/util/uuid.hpp"

namespace orchestrator::kv::memory {

namespace {

bool HasPrefix(const std::string& key, const std::string& prefix) {
  return key.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

MemoryStore::MemoryStore(size_t max_tombstones) : max_tombstones_(max_tombstones) {
}

KVPair MemoryStore::ToPair(const std::string& key, const Entry& entry) {
  KVPair pair;
  pair.key          = key;
  pair.value        = entry.value;
  pair.create_index = entry.create_index;
  pair.modify_index = entry.modify_index;
  pair.session      = entry.session;
  return pair;
}

void MemoryStore::WriteLocked(const std::string& key, const std::string& value, const std::string& session) {
  ++index_;
  auto& entry = entries_[key];
  if (entry.create_index == 0) {
    entry.create_index = index_;
  }
  entry.value        = value;
  entry.modify_index = index_;
  entry.session      = session;
  ForgetTombstoneLocked(key);
  changed_.notify_all();
}

void MemoryStore::ForgetTombstoneLocked(const std::string& key) {
  auto it = tombstones_.find(key);
  if (it == tombstones_.end()) return;
  tombstones_by_index_.erase(it->second);
  tombstones_.erase(it);
}

void MemoryStore::EraseLocked(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) return;

  if (!it->second.session.empty()) {
    auto session_it = sessions_.find(it->second.session);
    if (session_it != sessions_.end()) session_it->second.held.erase(key);
  }

  entries_.erase(it);

  ForgetTombstoneLocked(key);
  tombstones_[key] = ++index_;
  tombstones_by_index_.emplace(index_, key);

  while (tombstones_.size() > max_tombstones_) {
    auto oldest      = tombstones_by_index_.begin();
    compacted_index_ = oldest->first;
    tombstones_.erase(oldest->second);
    tombstones_by_index_.erase(oldest);
  }
  changed_.notify_all();
}

void MemoryStore::DropSessionLocked(const std::string& session) {
  auto it = sessions_.find(session);
  if (it == sessions_.end()) return;

  // lock keys only exist while held
  const auto held = it->second.held;
  sessions_.erase(it);
  for (const auto& key : held) {
    EraseLocked(key);
  }
}

void MemoryStore::ExpireSessionsLocked() {
  const auto               now = Clock::now();
  std::vector<std::string> expired;
  for (const auto& [id, session] : sessions_) {
    if (session.expires_at <= now) expired.push_back(id);
  }
  for (const auto& id : expired) {
    DropSessionLocked(id);
  }
}

uint64_t MemoryStore::PrefixIndexLocked(const std::string& prefix) const {
  uint64_t index = compacted_index_;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end() && HasPrefix(it->first, prefix); ++it) {
    index = std::max(index, it->second.modify_index);
  }
  for (auto it = tombstones_.lower_bound(prefix); it != tombstones_.end() && HasPrefix(it->first, prefix); ++it) {
    index = std::max(index, it->second);
  }
  return index;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<KVPair> MemoryStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  ExpireSessionsLocked();

  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return ToPair(it->first, it->second);
}

std::vector<KVPair> MemoryStore::List(const std::string& prefix) {
  std::lock_guard lock(mutex_);
  ExpireSessionsLocked();

  std::vector<KVPair> pairs;
  for (auto it = entries_.lower_bound(prefix); it != entries_.end() && HasPrefix(it->first, prefix); ++it) {
    pairs.push_back(ToPair(it->first, it->second));
  }
  return pairs;
}

uint64_t MemoryStore::WaitIndex(const std::string& prefix, uint64_t after_index, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  ExpireSessionsLocked();

  changed_.wait_for(lock, timeout, [&] { return PrefixIndexLocked(prefix) > after_index; });
  return PrefixIndexLocked(prefix);
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

Result MemoryStore::Put(const KVPair& pair) {
  if (pair.key.empty()) return Result::Err(ErrorCode::InvalidArgument, "empty key");

  std::lock_guard lock(mutex_);
  auto            it      = entries_.find(pair.key);
  const auto      session = it == entries_.end() ? std::string{} : it->second.session;
  WriteLocked(pair.key, pair.value, session);
  return Result::Ok();
}

Result MemoryStore::CheckAndSet(const KVPair& pair) {
  if (pair.key.empty()) return Result::Err(ErrorCode::InvalidArgument, "empty key");

  std::lock_guard lock(mutex_);
  auto            it = entries_.find(pair.key);

  if (pair.modify_index == 0) {
    if (it != entries_.end()) return Result::Err(ErrorCode::Conflict, pair.key + " already exists");
    WriteLocked(pair.key, pair.value, {});
    return Result::Ok();
  }

  if (it == entries_.end()) return Result::Err(ErrorCode::Conflict, pair.key + " no longer exists");
  if (it->second.modify_index != pair.modify_index) {
    return Result::Err(ErrorCode::Conflict, pair.key + " was modified concurrently");
  }

  WriteLocked(pair.key, pair.value, it->second.session);
  return Result::Ok();
}

Result MemoryStore::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);
  EraseLocked(key);
  return Result::Ok();
}

Result MemoryStore::DeleteCheckAndSet(const std::string& key, uint64_t modify_index) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(key);
  if (it == entries_.end()) return Result::Err(ErrorCode::NotFound, key);
  if (it->second.modify_index != modify_index) return Result::Err(ErrorCode::Conflict, key + " was modified concurrently");

  EraseLocked(key);
  return Result::Ok();
}

// ------------------------------------------------------------
// Sessions and locks
// ------------------------------------------------------------

std::string MemoryStore::CreateSession(const std::string& name, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto id = util::GenerateUUIDString();
  Session    session;
  session.name       = name;
  session.ttl        = ttl;
  session.expires_at = Clock::now() + ttl;
  sessions_.emplace(id, std::move(session));
  return id;
}

Result MemoryStore::RenewSession(const std::string& session) {
  std::lock_guard lock(mutex_);
  ExpireSessionsLocked();

  auto it = sessions_.find(session);
  if (it == sessions_.end()) return Result::Err(ErrorCode::NotFound, "session " + session + " expired or destroyed");

  it->second.expires_at = Clock::now() + it->second.ttl;
  return Result::Ok();
}

Result MemoryStore::DestroySession(const std::string& session) {
  std::lock_guard lock(mutex_);
  DropSessionLocked(session);
  return Result::Ok();
}

Result MemoryStore::Acquire(const std::string& key, const std::string& session) {
  std::lock_guard lock(mutex_);
  ExpireSessionsLocked();

  auto session_it = sessions_.find(session);
  if (session_it == sessions_.end()) return Result::Err(ErrorCode::NotFound, "session " + session + " expired or destroyed");

  auto it = entries_.find(key);
  if (it != entries_.end() && !it->second.session.empty()) {
    if (it->second.session == session) return Result::Ok();
    return Result::Err(ErrorCode::Conflict, key + " is locked by another session");
  }

  const auto value = it == entries_.end() ? std::string{} : it->second.value;
  WriteLocked(key, value, session);
  session_it->second.held.insert(key);
  return Result::Ok();
}

size_t MemoryStore::TombstoneCount() {
  std::lock_guard lock(mutex_);
  return tombstones_.size();
}

Result MemoryStore::Release(const std::string& key, const std::string& session) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.session != session) {
    return Result::Err(ErrorCode::Conflict, key + " is not held by session " + session);
  }

  EraseLocked(key);
  return Result::Ok();
}

} // namespace orchestrator::kv::memory
