#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace catalog::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Holds the writer connection for its whole lifetime; a second transaction
  on the same store blocks until this one finishes.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  // Writer connection; throws CatalogBackendError once the transaction has
  // committed or rolled back, since the connection is no longer ours.
  sqlite3* Handle() const {
    EnsureOpen();
    return db_->Handle();
  }
  SqliteDB& DB() const {
    EnsureOpen();
    return *db_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void EnsureOpen() const;

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

}
