#pragma once

#include <memory>
#include <string>
#include <pqxx/pqxx>
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace catalog::db::postgres {

/*
  pqxx::work on a pooled connection. The connection goes back to the pool
  when the transaction is destroyed.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  // Throws CatalogBackendError once the transaction has committed or
  // rolled back.
  pqxx::work& Work() {
    EnsureOpen();
    return *tx_;
  }

  // Runs fn(pqxx::subtransaction&) under a savepoint. If fn throws, only the
  // savepoint is rolled back and this transaction stays usable.
  template <typename Fn>
  void WithSavepoint(const std::string& name, Fn&& fn) {
    pqxx::subtransaction savepoint(Work(), name);
    fn(savepoint);
    savepoint.commit();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void EnsureOpen() const;

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool finished_  = false;
};

// SQLSTATE classes: 40001 serialization, 40P01 deadlock, 23505 unique,
// 23503 foreign key, other 23xxx constraint. Broken connections are IOError.
Result Translate(const std::exception& e);

}
