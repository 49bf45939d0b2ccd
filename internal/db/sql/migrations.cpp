#include "internal/db/sql/migrations.hpp"

namespace catalog::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> schema = {
      "CREATE TABLE IF NOT EXISTS project (project_id TEXT PRIMARY KEY, project_name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS warehouse (warehouse_id TEXT PRIMARY KEY, warehouse_name TEXT NOT NULL, "
      "project_id TEXT NOT NULL REFERENCES project(project_id), storage_profile TEXT NOT NULL, "
      "storage_secret_id TEXT, status TEXT NOT NULL DEFAULT 'active', "
      "tabular_delete_mode TEXT NOT NULL DEFAULT 'hard', tabular_expiration_seconds INTEGER, "
      "protected INTEGER NOT NULL DEFAULT 0, version INTEGER NOT NULL DEFAULT 1, "
      "UNIQUE(project_id, warehouse_name));",
      "CREATE TABLE IF NOT EXISTS namespace (warehouse_id TEXT NOT NULL REFERENCES warehouse(warehouse_id), "
      "namespace_name TEXT NOT NULL, PRIMARY KEY (warehouse_id, namespace_name));",
      "CREATE TABLE IF NOT EXISTS task (task_id TEXT PRIMARY KEY, "
      "warehouse_id TEXT NOT NULL REFERENCES warehouse(warehouse_id));",
  };
  return schema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> schema = {
      "CREATE TABLE IF NOT EXISTS project (project_id UUID PRIMARY KEY, project_name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS warehouse (warehouse_id UUID PRIMARY KEY, warehouse_name TEXT NOT NULL, "
      "project_id UUID NOT NULL REFERENCES project(project_id), storage_profile JSONB NOT NULL, "
      "storage_secret_id UUID, status TEXT NOT NULL DEFAULT 'active', "
      "tabular_delete_mode TEXT NOT NULL DEFAULT 'hard', tabular_expiration_seconds BIGINT, "
      "protected BOOLEAN NOT NULL DEFAULT false, version BIGINT NOT NULL DEFAULT 1, "
      "UNIQUE(project_id, warehouse_name));",
      "CREATE TABLE IF NOT EXISTS namespace (warehouse_id UUID NOT NULL REFERENCES warehouse(warehouse_id), "
      "namespace_name TEXT NOT NULL, PRIMARY KEY (warehouse_id, namespace_name));",
      "CREATE TABLE IF NOT EXISTS task (task_id TEXT PRIMARY KEY, "
      "warehouse_id UUID NOT NULL REFERENCES warehouse(warehouse_id));",
  };
  return schema;
}

} // namespace catalog::db::sql
