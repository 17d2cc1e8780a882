#include "sqlite_store.hpp"

#include <algorithm>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "sqlite_tx.hpp"

namespace orchestrator::kv::sqlite {

namespace {

bool IsBusy(const SqliteError& e) {
  return e.Code() == SQLITE_BUSY || e.Code() == SQLITE_LOCKED;
}

[[noreturn]] void ThrowRead(const SqliteError& e, const std::string& context) {
  if (IsBusy(e)) {
    throw util::StoreUnavailable(context + ": " + e.what());
  }
  throw std::runtime_error(context + ": " + e.what());
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db, std::chrono::milliseconds poll_interval, uint64_t max_tombstones)
    : db_(std::move(db)), poll_interval_(poll_interval), max_tombstones_(max_tombstones) {
}

void SqliteStore::Bootstrap() {
  static const char* kBootstrapSql[] = {
      "CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value TEXT NOT NULL, create_index INTEGER NOT NULL, modify_index INTEGER NOT NULL, session TEXT);",
      "CREATE TABLE IF NOT EXISTS kv_tombstones (key TEXT PRIMARY KEY, modify_index INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS kv_tombstones_by_index ON kv_tombstones(modify_index);",
      "CREATE TABLE IF NOT EXISTS kv_compacted (id INTEGER PRIMARY KEY CHECK (id = 1), value INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO kv_compacted(id, value) VALUES (1, 0);",
      "CREATE TABLE IF NOT EXISTS kv_sessions (id TEXT PRIMARY KEY, name TEXT NOT NULL, ttl_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS kv_index (id INTEGER PRIMARY KEY CHECK (id = 1), value INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO kv_index(id, value) VALUES (1, 0);"};

  std::lock_guard lock(mutex_);
  for (const auto* sql : kBootstrapSql) {
    db_->Exec(sql);
  }
}

Result SqliteStore::Translate(const SqliteError& e) {
  if (IsBusy(e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  if (e.Code() == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result SqliteStore::Write(const std::function<Result()>& fn) {
  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(db_);
    ExpireSessions();
    auto result = fn();
    if (result) {
      tx.Commit();
    } else {
      tx.Rollback();
    }
    return result;
  } catch (const SqliteError& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------
// Row helpers (caller holds mutex_, usually inside a transaction)
// ------------------------------------------------------------

uint64_t SqliteStore::NextIndex() {
  Statement(*db_, "UPDATE kv_index SET value = value + 1 WHERE id = 1;").Run();

  Statement select(*db_, "SELECT value FROM kv_index WHERE id = 1;");
  if (!select.Step()) throw SqliteError(SQLITE_CORRUPT, "kv_index row missing");
  return select.U64(0);
}

uint64_t SqliteStore::PrefixIndex(const std::string& prefix) {
  Statement select(*db_,
                   "SELECT MAX(idx) FROM ("
                   " SELECT MAX(modify_index) AS idx FROM kv WHERE substr(key, 1, ?1) = ?2"
                   " UNION ALL"
                   " SELECT MAX(modify_index) AS idx FROM kv_tombstones WHERE substr(key, 1, ?1) = ?2"
                   " UNION ALL"
                   " SELECT value AS idx FROM kv_compacted WHERE id = 1);");
  select.Bind(1, static_cast<uint64_t>(prefix.size())).Bind(2, prefix);
  if (!select.Step() || select.IsNull(0)) return 0;
  return select.U64(0);
}

std::optional<KVPair> SqliteStore::Lookup(const std::string& key) {
  Statement select(*db_, "SELECT key, value, create_index, modify_index, session FROM kv WHERE key = ?1;");
  select.Bind(1, key);
  if (!select.Step()) return std::nullopt;

  KVPair pair;
  pair.key          = select.Text(0);
  pair.value        = select.Text(1);
  pair.create_index = select.U64(2);
  pair.modify_index = select.U64(3);
  pair.session      = select.IsNull(4) ? std::string{} : select.Text(4);
  return pair;
}

void SqliteStore::Upsert(const std::string& key, const std::string& value, const std::string& session, uint64_t create_index) {
  const auto index = NextIndex();

  Statement upsert(*db_,
                   "INSERT INTO kv(key, value, create_index, modify_index, session) VALUES(?1, ?2, ?3, ?4, NULLIF(?5, '')) "
                   "ON CONFLICT(key) DO UPDATE SET value = excluded.value, modify_index = excluded.modify_index, session = excluded.session;");
  upsert.Bind(1, key).Bind(2, value).Bind(3, create_index == 0 ? index : create_index).Bind(4, index).Bind(5, session);
  upsert.Run();

  Statement(*db_, "DELETE FROM kv_tombstones WHERE key = ?1;").Bind(1, key).Run();
}

void SqliteStore::Erase(const std::string& key) {
  Statement erase(*db_, "DELETE FROM kv WHERE key = ?1;");
  erase.Bind(1, key).Run();
  if (erase.Changes() == 0) return;

  const auto index = NextIndex();
  Statement  tombstone(*db_,
                       "INSERT INTO kv_tombstones(key, modify_index) VALUES(?1, ?2) "
                       "ON CONFLICT(key) DO UPDATE SET modify_index = excluded.modify_index;");
  tombstone.Bind(1, key).Bind(2, index).Run();

  CompactTombstones();
}

uint64_t SqliteStore::CountTombstones() {
  Statement count(*db_, "SELECT COUNT(*) FROM kv_tombstones;");
  if (!count.Step()) return 0;
  return count.U64(0);
}

void SqliteStore::CompactTombstones() {
  const auto count = CountTombstones();
  if (count <= max_tombstones_) return;

  // index of the newest tombstone to evict; indexes are unique store-wide
  Statement floor_select(*db_, "SELECT modify_index FROM kv_tombstones ORDER BY modify_index LIMIT 1 OFFSET ?1;");
  floor_select.Bind(1, count - max_tombstones_ - 1);
  if (!floor_select.Step()) return;
  const auto floor = floor_select.U64(0);

  Statement(*db_, "UPDATE kv_compacted SET value = max(value, ?1) WHERE id = 1;").Bind(1, floor).Run();
  Statement(*db_, "DELETE FROM kv_tombstones WHERE modify_index <= ?1;").Bind(1, floor).Run();
}

void SqliteStore::DropSession(const std::string& session) {
  std::vector<std::string> held;
  {
    Statement select(*db_, "SELECT key FROM kv WHERE session = ?1;");
    select.Bind(1, session);
    while (select.Step()) held.push_back(select.Text(0));
  }

  // lock keys only exist while held
  for (const auto& key : held) {
    Erase(key);
  }
  Statement(*db_, "DELETE FROM kv_sessions WHERE id = ?1;").Bind(1, session).Run();
}

void SqliteStore::ExpireSessions() {
  std::vector<std::string> expired;
  {
    Statement select(*db_, "SELECT id FROM kv_sessions WHERE expires_at_ms <= ?1;");
    select.Bind(1, util::NowMillis());
    while (select.Step()) expired.push_back(select.Text(0));
  }
  for (const auto& session : expired) {
    DropSession(session);
  }
}

bool SqliteStore::SessionAlive(const std::string& session) {
  Statement select(*db_, "SELECT 1 FROM kv_sessions WHERE id = ?1 AND expires_at_ms > ?2;");
  select.Bind(1, session).Bind(2, util::NowMillis());
  return select.Step();
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<KVPair> SqliteStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  try {
    auto pair = Lookup(key);
    // an expired holder no longer owns the key even before it is reaped
    if (pair && !pair->session.empty() && !SessionAlive(pair->session)) {
      return std::nullopt;
    }
    return pair;
  } catch (const SqliteError& e) {
    ThrowRead(e, "get " + key);
  }
}

std::vector<KVPair> SqliteStore::List(const std::string& prefix) {
  std::lock_guard lock(mutex_);
  try {
    Statement select(*db_,
                     "SELECT key, value, create_index, modify_index, session FROM kv "
                     "WHERE substr(key, 1, ?1) = ?2 ORDER BY key;");
    select.Bind(1, static_cast<uint64_t>(prefix.size())).Bind(2, prefix);

    std::vector<KVPair> pairs;
    while (select.Step()) {
      KVPair pair;
      pair.key          = select.Text(0);
      pair.value        = select.Text(1);
      pair.create_index = select.U64(2);
      pair.modify_index = select.U64(3);
      pair.session      = select.IsNull(4) ? std::string{} : select.Text(4);
      pairs.push_back(std::move(pair));
    }
    return pairs;
  } catch (const SqliteError& e) {
    ThrowRead(e, "list " + prefix);
  }
}

uint64_t SqliteStore::WaitIndex(const std::string& prefix, uint64_t after_index, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    uint64_t index = 0;
    {
      std::lock_guard lock(mutex_);
      try {
        index = PrefixIndex(prefix);
      } catch (const SqliteError& e) {
        ThrowRead(e, "watch " + prefix);
      }
    }

    const auto now = std::chrono::steady_clock::now();
    if (index > after_index || now >= deadline) return index;

    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(poll_interval_, deadline - now));
  }
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

Result SqliteStore::Put(const KVPair& pair) {
  if (pair.key.empty()) return Result::Err(ErrorCode::InvalidArgument, "empty key");

  return Write([&] {
    const auto existing = Lookup(pair.key);
    Upsert(pair.key, pair.value, existing ? existing->session : std::string{}, existing ? existing->create_index : 0);
    return Result::Ok();
  });
}

Result SqliteStore::CheckAndSet(const KVPair& pair) {
  if (pair.key.empty()) return Result::Err(ErrorCode::InvalidArgument, "empty key");

  return Write([&] {
    const auto existing = Lookup(pair.key);
    if (pair.modify_index == 0) {
      if (existing) return Result::Err(ErrorCode::Conflict, pair.key + " already exists");
      Upsert(pair.key, pair.value, {}, 0);
      return Result::Ok();
    }

    if (!existing) return Result::Err(ErrorCode::Conflict, pair.key + " no longer exists");
    if (existing->modify_index != pair.modify_index) return Result::Err(ErrorCode::Conflict, pair.key + " was modified concurrently");

    Upsert(pair.key, pair.value, existing->session, existing->create_index);
    return Result::Ok();
  });
}

Result SqliteStore::Delete(const std::string& key) {
  return Write([&] {
    Erase(key);
    return Result::Ok();
  });
}

Result SqliteStore::DeleteCheckAndSet(const std::string& key, uint64_t modify_index) {
  return Write([&] {
    const auto existing = Lookup(key);
    if (!existing) return Result::Err(ErrorCode::NotFound, key);
    if (existing->modify_index != modify_index) return Result::Err(ErrorCode::Conflict, key + " was modified concurrently");

    Erase(key);
    return Result::Ok();
  });
}

uint64_t SqliteStore::TombstoneCount() {
  std::lock_guard lock(mutex_);
  try {
    return CountTombstones();
  } catch (const SqliteError& e) {
    ThrowRead(e, "count tombstones");
  }
}

// ------------------------------------------------------------
// Sessions and locks
// ------------------------------------------------------------

std::string SqliteStore::CreateSession(const std::string& name, std::chrono::milliseconds ttl) {
  const auto id     = util::GenerateUUIDString();
  const auto result = Write([&] {
    Statement insert(*db_, "INSERT INTO kv_sessions(id, name, ttl_ms, expires_at_ms) VALUES(?1, ?2, ?3, ?4);");
    insert.Bind(1, id).Bind(2, name).Bind(3, static_cast<uint64_t>(ttl.count())).Bind(4, util::NowMillis() + static_cast<uint64_t>(ttl.count()));
    insert.Run();
    return Result::Ok();
  });

  if (result.code == ErrorCode::Unavailable) throw util::StoreUnavailable("create session: " + result.message);
  if (!result) throw std::runtime_error("create session: " + result.message);
  return id;
}

Result SqliteStore::RenewSession(const std::string& session) {
  return Write([&] {
    Statement update(*db_, "UPDATE kv_sessions SET expires_at_ms = ?2 + ttl_ms WHERE id = ?1;");
    update.Bind(1, session).Bind(2, util::NowMillis()).Run();
    if (update.Changes() == 0) return Result::Err(ErrorCode::NotFound, "session " + session + " expired or destroyed");
    return Result::Ok();
  });
}

Result SqliteStore::DestroySession(const std::string& session) {
  return Write([&] {
    DropSession(session);
    return Result::Ok();
  });
}

Result SqliteStore::Acquire(const std::string& key, const std::string& session) {
  return Write([&] {
    if (!SessionAlive(session)) return Result::Err(ErrorCode::NotFound, "session " + session + " expired or destroyed");

    const auto existing = Lookup(key);
    if (existing && !existing->session.empty()) {
      if (existing->session == session) return Result::Ok();
      return Result::Err(ErrorCode::Conflict, key + " is locked by another session");
    }

    Upsert(key, existing ? existing->value : std::string{}, session, existing ? existing->create_index : 0);
    return Result::Ok();
  });
}

Result SqliteStore::Release(const std::string& key, const std::string& session) {
  return Write([&] {
    const auto existing = Lookup(key);
    if (!existing || existing->session != session) return Result::Err(ErrorCode::Conflict, key + " is not held by session " + session);

    Erase(key);
    return Result::Ok();
  });
}

} // namespace orchestrator::kv::sqlite
