#include "sqlite_tx.hpp"

#include "internal/error/backend_error.hpp"
#include "internal/observability/logging.hpp"

namespace catalog::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->Lock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& ex) {
    CATALOG_LOG_WARN("sqlite rollback failed", {observability::StringField("error", ex.what())});
  }
}

void SqliteTransaction::EnsureOpen() const {
  if (finished_) {
    throw error::CatalogBackendError::Unexpected("transaction already finished");
  }
}

void SqliteTransaction::Commit() {
  EnsureOpen();
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  EnsureOpen();
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace catalog::db::sqlite
