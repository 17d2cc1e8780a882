#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace orchestrator::kv::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_ || rolled_back_) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    ORCHESTRATOR_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  rolled_back_ = true;
}

} // namespace orchestrator::kv::sqlite
