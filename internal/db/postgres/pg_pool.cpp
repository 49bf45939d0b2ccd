#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace catalog::db::postgres {

namespace {

// '?' -> $1, $2, ... and no trailing ';'
std::string NumberPlaceholders(const char* sqlite_sql) {
  std::string out;
  int         n = 0;
  for (const char* c = sqlite_sql; *c != '\0'; ++c) {
    if (*c == '?') {
      out += "$" + std::to_string(++n);
    } else if (*c != ';') {
      out += *c;
    }
  }
  return out;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_project", NumberPlaceholders(sql::INSERT_PROJECT));
  conn.prepare("select_project_exists", NumberPlaceholders(sql::SELECT_PROJECT_EXISTS));

  conn.prepare("insert_warehouse", NumberPlaceholders(sql::INSERT_WAREHOUSE));
  // row lock so guard evaluation and removal see the same warehouse state
  conn.prepare("select_warehouse_guards", NumberPlaceholders(sql::SELECT_WAREHOUSE_GUARDS) + " FOR UPDATE OF w");
  conn.prepare("delete_warehouse_namespaces", NumberPlaceholders(sql::DELETE_WAREHOUSE_NAMESPACES));
  conn.prepare("delete_warehouse", NumberPlaceholders(sql::DELETE_WAREHOUSE));
  conn.prepare("rename_active_warehouse", NumberPlaceholders(sql::RENAME_ACTIVE_WAREHOUSE));
  conn.prepare("update_warehouse_status", NumberPlaceholders(sql::UPDATE_WAREHOUSE_STATUS));
  conn.prepare("update_warehouse_protected", NumberPlaceholders(sql::UPDATE_WAREHOUSE_PROTECTED));
  conn.prepare("bump_warehouse_version", NumberPlaceholders(sql::BUMP_WAREHOUSE_VERSION));

  conn.prepare("select_warehouses_by_project", NumberPlaceholders(sql::SELECT_WAREHOUSES_BY_PROJECT));
  conn.prepare("select_warehouse_by_id", NumberPlaceholders(sql::SELECT_WAREHOUSE_BY_ID));

  conn.prepare("insert_namespace", NumberPlaceholders(sql::INSERT_NAMESPACE));
  conn.prepare("insert_task", NumberPlaceholders(sql::INSERT_TASK));
  conn.prepare("delete_task_returning_warehouse", NumberPlaceholders(sql::DELETE_TASK_RETURNING_WAREHOUSE));
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace catalog::db::postgres
