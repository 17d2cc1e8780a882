#include "sqlite_db.hpp"

namespace orchestrator::kv::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw SqliteError(rc, msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets watchers in other processes read while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

// ------------------------------------------------------------
// Statement
// ------------------------------------------------------------

Statement::Statement(const SqliteDB& db, const char* sql) : db_(db.Handle()) {
  ThrowIf(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::Bind(int idx, const std::string& value) {
  ThrowIf(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT), db_, "sqlite bind");
  return *this;
}

Statement& Statement::Bind(int idx, uint64_t value) {
  ThrowIf(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)), db_, "sqlite bind");
  return *this;
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw SqliteError(rc, std::string("sqlite step: ") + sqlite3_errmsg(db_));
}

void Statement::Run() {
  while (Step()) {
  }
}

int Statement::Changes() const {
  return sqlite3_changes(db_);
}

std::string Statement::Text(int col) const {
  const auto* text = sqlite3_column_text(stmt_, col);
  const int   size = sqlite3_column_bytes(stmt_, col);
  return text ? std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size)) : std::string{};
}

uint64_t Statement::U64(int col) const {
  return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col));
}

bool Statement::IsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

} // namespace orchestrator::kv::sqlite
