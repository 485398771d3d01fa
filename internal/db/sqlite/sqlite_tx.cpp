#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace streamledger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->LockTransaction()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  if (const int rc = db_->TryExec("ROLLBACK;"); rc != SQLITE_OK) {
    STREAMLEDGER_LOG_WARN("sqlite rollback failed", {observability::StringField("error", sqlite3_errstr(rc))});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace streamledger::db::sqlite
