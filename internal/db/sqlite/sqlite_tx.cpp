#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace doccache::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  // Destructors must not throw; a failed rollback leaves sqlite to abort
  // the transaction when the connection closes.
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    DOCCACHE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
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

} // namespace doccache::db::sqlite
