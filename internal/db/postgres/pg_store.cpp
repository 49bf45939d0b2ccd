#include "pg_store.hpp"

#include <algorithm>

#include "internal/db/model/warehouse_record.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/warehouse_codec.hpp"
#include "internal/error/backend_error.hpp"
#include "internal/error/warehouse_errors.hpp"

namespace catalog::db::postgres {

namespace {

[[noreturn]] void Rethrow(const std::exception& e, const char* what) {
  throw error::CatalogBackendError::FromResult(Translate(e)).AppendDetail(what);
}

std::optional<std::string> Nullable(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

struct StoredWarehouse {
  WarehouseRecord record;
  bool            project_exists = false;
};

StoredWarehouse ReadWarehouse(const pqxx::row& row) {
  StoredWarehouse out;
  out.record.warehouse_id      = row[0].c_str();
  out.record.warehouse_name    = row[1].c_str();
  out.record.project_id        = row[2].c_str();
  out.record.storage_profile   = row[3].c_str();
  out.record.storage_secret_id = row[4].is_null() ? "" : row[4].c_str();
  out.record.status            = row[5].c_str();
  out.record.tabular_delete_mode = row[6].c_str();
  out.record.tabular_expiration_seconds = row[7].is_null() ? 0 : row[7].as<int64_t>();
  out.record.is_protected      = row[8].as<bool>();
  out.record.version           = row[9].as<uint64_t>();
  out.project_exists           = row[10].as<bool>();
  return out;
}

model::GetWarehouseResponse Decode(const StoredWarehouse& row) {
  if (!row.project_exists) {
    throw error::DatabaseIntegrityError("Warehouse " + row.record.warehouse_id + " references missing project " +
                                        row.record.project_id);
  }
  return DecodeWarehouse(row.record);
}

class PgMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {}

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

private:
  pqxx::work& tx_;
};

} // namespace

PgCatalogStore::PgCatalogStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgCatalogStore::ApplySchema() {
  PgTransaction tx(pool_);
  try {
    PgMigrationExecutor executor(tx.Work());
    sql::RunMigrations(executor, sql::PostgresSchema());
  } catch (const pqxx::failure& e) {
    Rethrow(e, "applying catalog schema");
  }
  tx.Commit();
}

std::unique_ptr<db::Transaction> PgCatalogStore::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgCatalogStore::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

void PgCatalogStore::CreateProject(Transaction& t, const model::ProjectId& project_id, const std::string& name) {
  try {
    TX(t).Work().exec_prepared("insert_project", project_id.ToString(), name);
  } catch (const pqxx::failure& e) {
    Rethrow(e, "inserting project");
  }
}

model::WarehouseId PgCatalogStore::CreateWarehouse(Transaction& t, const std::string& warehouse_name,
                                                   const model::ProjectId& project_id,
                                                   const catalog::v1::StorageProfile& storage_profile,
                                                   const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                                   const std::optional<model::SecretIdent>& storage_secret_id) {
  auto& tx   = TX(t);
  auto& work = tx.Work();

  pqxx::result project;
  try {
    project = work.exec_prepared("select_project_exists", project_id.ToString());
  } catch (const pqxx::failure& e) {
    Rethrow(e, "checking project");
  }
  if (project.empty()) {
    throw error::ProjectIdNotFoundError(project_id);
  }

  const auto warehouse_id = model::WarehouseId::Generate();
  const auto record = EncodeWarehouse(warehouse_id, warehouse_name, project_id, storage_profile,
                                      tabular_delete_profile, storage_secret_id);

  try {
    tx.WithSavepoint("insert_warehouse", [&](pqxx::subtransaction& insert) {
      insert.exec_prepared("insert_warehouse", record.warehouse_id, record.warehouse_name, record.project_id,
                           record.storage_profile, Nullable(record.storage_secret_id), record.status,
                           record.tabular_delete_mode, record.tabular_expiration_seconds, record.is_protected,
                           static_cast<int64_t>(record.version));
    });
  } catch (const pqxx::failure& e) {
    auto result = Translate(e);
    if (result.code == ErrorCode::AlreadyExists) {
      throw error::WarehouseAlreadyExists(warehouse_name, project_id);
    }
    throw error::CatalogBackendError::FromResult(result).AppendDetail("inserting warehouse");
  }
  return warehouse_id;
}

void PgCatalogStore::DeleteWarehouse(Transaction& t, const model::WarehouseId& warehouse_id,
                                     const catalog::v1::DeleteWarehouseQuery& query) {
  auto&      work = TX(t).Work();
  const auto key  = warehouse_id.ToString();

  pqxx::result guards;
  try {
    guards = work.exec_prepared("select_warehouse_guards", key);
  } catch (const pqxx::failure& e) {
    Rethrow(e, "reading warehouse delete guards");
  }
  if (guards.empty()) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }

  const bool is_protected   = guards[0][0].as<bool>();
  const bool has_tasks      = guards[0][1].as<bool>();
  const bool has_namespaces = guards[0][2].as<bool>();

  if (has_tasks) throw error::WarehouseHasUnfinishedTasks();
  if (is_protected && !query.force()) throw error::WarehouseProtected();
  if (has_namespaces && !query.force()) throw error::WarehouseNotEmpty();

  try {
    work.exec_prepared("delete_warehouse_namespaces", key);
    work.exec_prepared("delete_warehouse", key);
  } catch (const pqxx::failure& e) {
    Rethrow(e, "deleting warehouse");
  }
}

void PgCatalogStore::RenameWarehouse(Transaction& t, const model::WarehouseId& warehouse_id,
                                     const std::string& new_name) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared("rename_active_warehouse", new_name, warehouse_id.ToString());
  } catch (const pqxx::failure& e) {
    Rethrow(e, "renaming warehouse");
  }
  if (res.affected_rows() == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
}

void PgCatalogStore::SetWarehouseStatus(Transaction& t, const model::WarehouseId& warehouse_id,
                                        model::WarehouseStatus status) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared("update_warehouse_status", std::string(model::ToString(status)),
                                     warehouse_id.ToString());
  } catch (const pqxx::failure& e) {
    Rethrow(e, "updating warehouse status");
  }
  if (res.affected_rows() == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
}

void PgCatalogStore::SetWarehouseProtected(Transaction& t, const model::WarehouseId& warehouse_id,
                                           bool is_protected) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared("update_warehouse_protected", is_protected, warehouse_id.ToString());
  } catch (const pqxx::failure& e) {
    Rethrow(e, "updating warehouse protection");
  }
  if (res.affected_rows() == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
}

std::vector<model::GetWarehouseResponse> PgCatalogStore::ListWarehouses(
    const model::ProjectId& project_id, const std::vector<model::WarehouseStatus>& statuses) {
  std::vector<StoredWarehouse> rows;
  try {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    for (const auto& row : tx.exec_prepared("select_warehouses_by_project", project_id.ToString())) {
      rows.push_back(ReadWarehouse(row));
    }
  } catch (const pqxx::failure& e) {
    Rethrow(e, "listing warehouses");
  }

  std::vector<model::GetWarehouseResponse> out;
  for (const auto& row : rows) {
    auto warehouse = Decode(row);
    if (std::find(statuses.begin(), statuses.end(), warehouse.status) != statuses.end()) {
      out.push_back(std::move(warehouse));
    }
  }
  return out;
}

std::optional<model::GetWarehouseResponse> PgCatalogStore::GetWarehouseById(const model::WarehouseId& warehouse_id) {
  std::optional<StoredWarehouse> row;
  try {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    auto                   res = tx.exec_prepared("select_warehouse_by_id", warehouse_id.ToString());
    if (!res.empty()) {
      row = ReadWarehouse(res[0]);
    }
  } catch (const pqxx::failure& e) {
    Rethrow(e, "reading warehouse");
  }

  if (!row) return std::nullopt;
  return Decode(*row);
}

void PgCatalogStore::AddNamespace(Transaction& t, const model::WarehouseId& warehouse_id,
                                  const std::string& namespace_name) {
  auto&        work = TX(t).Work();
  pqxx::result res;
  try {
    res = work.exec_prepared("bump_warehouse_version", warehouse_id.ToString());
    if (res.affected_rows() != 0) {
      work.exec_prepared("insert_namespace", warehouse_id.ToString(), namespace_name);
    }
  } catch (const pqxx::failure& e) {
    Rethrow(e, "inserting namespace");
  }
  if (res.affected_rows() == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
}

void PgCatalogStore::EnqueueTask(Transaction& t, const model::WarehouseId& warehouse_id, const std::string& task_id) {
  auto&        work = TX(t).Work();
  pqxx::result res;
  try {
    res = work.exec_prepared("bump_warehouse_version", warehouse_id.ToString());
    if (res.affected_rows() != 0) {
      work.exec_prepared("insert_task", task_id, warehouse_id.ToString());
    }
  } catch (const pqxx::failure& e) {
    Rethrow(e, "inserting task");
  }
  if (res.affected_rows() == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
}

void PgCatalogStore::FinishTask(Transaction& t, const std::string& task_id) {
  auto&        work = TX(t).Work();
  pqxx::result res;
  try {
    res = work.exec_prepared("delete_task_returning_warehouse", task_id);
    if (!res.empty()) {
      work.exec_prepared("bump_warehouse_version", res[0][0].c_str());
    }
  } catch (const pqxx::failure& e) {
    Rethrow(e, "deleting task");
  }
  if (res.empty()) {
    throw error::CatalogBackendError::Unexpected("task '" + task_id + "' not found");
  }
}

}
