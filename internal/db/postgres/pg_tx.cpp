#include "pg_tx.hpp"

#include "internal/error/backend_error.hpp"
#include "internal/observability/logging.hpp"

namespace catalog::db::postgres {

Result Translate(const std::exception& e) {
  const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e);
  if (sql == nullptr) {
    if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
      return Result::Err(ErrorCode::IOError, e.what());
    }
    return Result::Err(ErrorCode::InternalError, e.what());
  }

  const auto& state = sql->sqlstate();
  if (state == "40001") return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (state == "40P01") return Result::Err(ErrorCode::Conflict, e.what());
  if (state == "23505") return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (state == "23503") return Result::Err(ErrorCode::ForeignKeyViolation, e.what());
  if (state.rfind("23", 0) == 0) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  } catch (const std::exception& e) {
    throw error::CatalogBackendError::FromResult(Translate(e)).AppendDetail("beginning postgres transaction");
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;

  try {
    tx_->abort();
  } catch (const std::exception& e) {
    CATALOG_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::EnsureOpen() const {
  if (finished_) {
    throw error::CatalogBackendError::Unexpected("transaction already finished");
  }
}

void PgTransaction::Commit() {
  EnsureOpen();
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    finished_ = true;
    throw error::CatalogBackendError::FromResult(Translate(e)).AppendDetail("committing postgres transaction");
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  EnsureOpen();
  finished_ = true;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    throw error::CatalogBackendError::FromResult(Translate(e)).AppendDetail("rolling back postgres transaction");
  }
}

}
