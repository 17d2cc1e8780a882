#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace orchestrator::kv::sqlite {

/*
  Raised by every helper in this directory; carries the primary sqlite
  result code so callers can tell busy/locked apart from real failures.
*/
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int Code() const {
    return code_ & 0xFF;
  }

 private:
  int code_;
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on scope exit.
*/
class Statement {
 public:
  Statement(const SqliteDB& db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Bind(int idx, const std::string& value);
  Statement& Bind(int idx, uint64_t value);

  // true while rows are produced; false once done
  bool Step();

  // for INSERT/UPDATE/DELETE
  void Run();

  int Changes() const;

  std::string Text(int col) const;
  uint64_t    U64(int col) const;
  bool        IsNull(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace orchestrator::kv::sqlite
