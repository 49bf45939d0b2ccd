#include "factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if CATALOG_DB_SQLITE
#include "internal/db/sqlite/sqlite_store.hpp"
#endif
#if CATALOG_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_store.hpp"
#endif

namespace catalog::factory {

using catalog::observability::StringField;

std::shared_ptr<db::CatalogStore> BuildStore(const catalog::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CATALOG_DB_SQLITE
    auto store = db::sqlite::SqliteCatalogStore::Open(database.sqlite().path(), database.sqlite().wal_mode());
    store->ApplySchema();
    CATALOG_LOG_INFO("catalog store ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return store;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CATALOG_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto pool  = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    auto store = std::make_shared<db::postgres::PgCatalogStore>(std::move(pool));
    store->ApplySchema();
    CATALOG_LOG_INFO("catalog store ready", {StringField("backend", "postgres")});
    return store;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CATALOG_LOG_INFO("catalog store ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryCatalogStore>();
}

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const catalog::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;
  deps.store = BuildStore(config);

  service::ServiceContext ctx;
  ctx.store = deps.store;

  deps.warehouse_service = std::make_shared<service::WarehouseService>(ctx);
  return deps;
}

}
