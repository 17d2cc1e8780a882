#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace orchestrator::kv::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock early so the index read-increment is serialized
      across processes sharing the file
    - rolls back on destruction unless committed
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();
  void Rollback();
  bool IsCommitted() const {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_   = false;
  bool                      rolled_back_ = false;
};

} // namespace orchestrator::kv::sqlite
