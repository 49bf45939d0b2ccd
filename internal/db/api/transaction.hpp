#pragma once

#include <type_traits>
#include <utility>

namespace catalog::db {

/*
  Unit of work over the catalog store.

  - Writes made through it are invisible to reads until Commit()
  - Commit() throws CatalogBackendError; ConcurrentModification means the
    caller may rerun the whole unit, reads included
  - Rollback() discards all writes
  - Destructor rolls back if neither Commit() nor Rollback() ran

  Stores and the warehouse service only write through a transaction they
  were handed; committing it is the caller's decision.

  SQLite: BEGIN IMMEDIATE on the writer connection
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot, validated against committed row versions on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

// Runs fn(tx) and commits when it returns normally. On an exception tx is
// left open for its owner to roll back.
template <typename Fn>
auto CommitAfter(Transaction& tx, Fn&& fn) -> std::invoke_result_t<Fn, Transaction&> {
  if constexpr (std::is_void_v<std::invoke_result_t<Fn, Transaction&>>) {
    std::forward<Fn>(fn)(tx);
    tx.Commit();
  } else {
    auto result = std::forward<Fn>(fn)(tx);
    tx.Commit();
    return result;
  }
}

}
