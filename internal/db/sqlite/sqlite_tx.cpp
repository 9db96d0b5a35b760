#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace ledcast::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  const int rc = db_->TryExec("ROLLBACK;");
  if (rc != SQLITE_OK) {
    LEDCAST_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::IntField("rc", rc)});
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

} // namespace ledcast::db::sqlite
