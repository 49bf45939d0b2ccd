#include "sqlite_store.hpp"

#include <algorithm>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/warehouse_codec.hpp"
#include "internal/error/backend_error.hpp"
#include "internal/error/warehouse_errors.hpp"

namespace catalog::db::sqlite {

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

// Steps once; SQLITE_ROW and SQLITE_DONE pass through, anything else is
// classified and thrown.
int Step(sqlite3* db, sqlite3_stmt* st, const char* what) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW || rc == SQLITE_DONE) return rc;
  throw error::CatalogBackendError::FromResult(Translate(db, rc)).AppendDetail(what);
}

struct StoredWarehouse {
  WarehouseRecord record;
  bool            project_exists = false;
};

StoredWarehouse ReadWarehouse(sqlite3_stmt* st) {
  StoredWarehouse row;
  row.record.warehouse_id               = ColText(st, 0);
  row.record.warehouse_name             = ColText(st, 1);
  row.record.project_id                 = ColText(st, 2);
  row.record.storage_profile            = ColText(st, 3);
  row.record.storage_secret_id          = ColText(st, 4);
  row.record.status                     = ColText(st, 5);
  row.record.tabular_delete_mode        = ColText(st, 6);
  row.record.tabular_expiration_seconds = sqlite3_column_int64(st, 7);
  row.record.is_protected               = sqlite3_column_int(st, 8) != 0;
  row.record.version                    = static_cast<uint64_t>(sqlite3_column_int64(st, 9));
  row.project_exists                    = sqlite3_column_int(st, 10) != 0;
  return row;
}

model::GetWarehouseResponse Decode(const StoredWarehouse& row) {
  if (!row.project_exists) {
    throw error::DatabaseIntegrityError("Warehouse " + row.record.warehouse_id + " references missing project " +
                                        row.record.project_id);
  }
  return DecodeWarehouse(row.record);
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {}

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

private:
  SqliteDB& db_;
};

} // namespace

SqliteCatalogStore::SqliteCatalogStore(std::shared_ptr<SqliteDB> writer, std::shared_ptr<SqliteDB> reader)
    : writer_(std::move(writer)), reader_(std::move(reader)) {}

std::shared_ptr<SqliteCatalogStore> SqliteCatalogStore::Open(const std::string& path, bool wal_mode) {
  auto writer = std::make_shared<SqliteDB>(path, wal_mode);
  auto reader = std::make_shared<SqliteDB>(path, wal_mode);
  return std::make_shared<SqliteCatalogStore>(std::move(writer), std::move(reader));
}

void SqliteCatalogStore::ApplySchema() {
  auto                    lock = writer_->Lock();
  SqliteMigrationExecutor executor(*writer_);
  sql::RunMigrations(executor, sql::SqliteSchema());
}

std::unique_ptr<db::Transaction> SqliteCatalogStore::Begin() {
  return std::make_unique<SqliteTransaction>(writer_);
}

SqliteTransaction& SqliteCatalogStore::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

void SqliteCatalogStore::CreateProject(Transaction& t, const model::ProjectId& project_id, const std::string& name) {
  auto& tx = TX(t);
  auto  st = tx.DB().Prepare(sql::INSERT_PROJECT);
  BindText(st.get(), 1, project_id.ToString());
  BindText(st.get(), 2, name);
  Step(tx.Handle(), st.get(), "inserting project");
}

// ------------------------------------------------------------------
// Warehouse lifecycle
// ------------------------------------------------------------------

model::WarehouseId SqliteCatalogStore::CreateWarehouse(Transaction& t, const std::string& warehouse_name,
                                                       const model::ProjectId& project_id,
                                                       const catalog::v1::StorageProfile& storage_profile,
                                                       const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                                       const std::optional<model::SecretIdent>& storage_secret_id) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  {
    auto st = tx.DB().Prepare(sql::SELECT_PROJECT_EXISTS);
    BindText(st.get(), 1, project_id.ToString());
    if (Step(db, st.get(), "checking project") != SQLITE_ROW) {
      throw error::ProjectIdNotFoundError(project_id);
    }
  }

  const auto warehouse_id = model::WarehouseId::Generate();
  const auto record = EncodeWarehouse(warehouse_id, warehouse_name, project_id, storage_profile,
                                      tabular_delete_profile, storage_secret_id);

  auto st = tx.DB().Prepare(sql::INSERT_WAREHOUSE);
  BindText(st.get(), 1, record.warehouse_id);
  BindText(st.get(), 2, record.warehouse_name);
  BindText(st.get(), 3, record.project_id);
  BindText(st.get(), 4, record.storage_profile);
  BindOptionalText(st.get(), 5, record.storage_secret_id);
  BindText(st.get(), 6, record.status);
  BindText(st.get(), 7, record.tabular_delete_mode);
  BindI64(st.get(), 8, record.tabular_expiration_seconds);
  BindI64(st.get(), 9, record.is_protected ? 1 : 0);
  BindI64(st.get(), 10, static_cast<int64_t>(record.version));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    auto result = Translate(db, rc);
    if (result.code == ErrorCode::AlreadyExists) {
      throw error::WarehouseAlreadyExists(warehouse_name, project_id);
    }
    throw error::CatalogBackendError::FromResult(result).AppendDetail("inserting warehouse");
  }
  return warehouse_id;
}

void SqliteCatalogStore::DeleteWarehouse(Transaction& t, const model::WarehouseId& warehouse_id,
                                         const catalog::v1::DeleteWarehouseQuery& query) {
  auto&      tx  = TX(t);
  auto*      db  = tx.Handle();
  const auto key = warehouse_id.ToString();

  bool is_protected   = false;
  bool has_tasks      = false;
  bool has_namespaces = false;
  {
    auto st = tx.DB().Prepare(sql::SELECT_WAREHOUSE_GUARDS);
    BindText(st.get(), 1, key);
    if (Step(db, st.get(), "reading warehouse delete guards") != SQLITE_ROW) {
      throw error::WarehouseIdNotFound(warehouse_id);
    }
    is_protected   = sqlite3_column_int(st.get(), 0) != 0;
    has_tasks      = sqlite3_column_int(st.get(), 1) != 0;
    has_namespaces = sqlite3_column_int(st.get(), 2) != 0;
  }

  if (has_tasks) throw error::WarehouseHasUnfinishedTasks();
  if (is_protected && !query.force()) throw error::WarehouseProtected();
  if (has_namespaces && !query.force()) throw error::WarehouseNotEmpty();

  for (const char* statement : {sql::DELETE_WAREHOUSE_NAMESPACES, sql::DELETE_WAREHOUSE}) {
    auto st = tx.DB().Prepare(statement);
    BindText(st.get(), 1, key);
    Step(db, st.get(), "deleting warehouse");
  }
}

void SqliteCatalogStore::RenameWarehouse(Transaction& t, const model::WarehouseId& warehouse_id,
                                         const std::string& new_name) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  auto st = tx.DB().Prepare(sql::RENAME_ACTIVE_WAREHOUSE);
  BindText(st.get(), 1, new_name);
  BindText(st.get(), 2, warehouse_id.ToString());
  Step(db, st.get(), "renaming warehouse");

  if (sqlite3_changes(db) == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
}

void SqliteCatalogStore::SetWarehouseStatus(Transaction& t, const model::WarehouseId& warehouse_id,
                                            model::WarehouseStatus status) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  auto st = tx.DB().Prepare(sql::UPDATE_WAREHOUSE_STATUS);
  BindText(st.get(), 1, std::string(model::ToString(status)));
  BindText(st.get(), 2, warehouse_id.ToString());
  Step(db, st.get(), "updating warehouse status");

  if (sqlite3_changes(db) == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
}

void SqliteCatalogStore::SetWarehouseProtected(Transaction& t, const model::WarehouseId& warehouse_id,
                                               bool is_protected) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  auto st = tx.DB().Prepare(sql::UPDATE_WAREHOUSE_PROTECTED);
  BindI64(st.get(), 1, is_protected ? 1 : 0);
  BindText(st.get(), 2, warehouse_id.ToString());
  Step(db, st.get(), "updating warehouse protection");

  if (sqlite3_changes(db) == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
}

// ------------------------------------------------------------------
// Reads (reader connection, committed state)
// ------------------------------------------------------------------

std::vector<model::GetWarehouseResponse> SqliteCatalogStore::ListWarehouses(
    const model::ProjectId& project_id, const std::vector<model::WarehouseStatus>& statuses) {
  std::vector<StoredWarehouse> rows;
  {
    auto lock = reader_->Lock();
    auto st   = reader_->Prepare(sql::SELECT_WAREHOUSES_BY_PROJECT);
    BindText(st.get(), 1, project_id.ToString());
    while (Step(reader_->Handle(), st.get(), "listing warehouses") == SQLITE_ROW) {
      rows.push_back(ReadWarehouse(st.get()));
    }
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

std::optional<model::GetWarehouseResponse> SqliteCatalogStore::GetWarehouseById(
    const model::WarehouseId& warehouse_id) {
  std::optional<StoredWarehouse> row;
  {
    auto lock = reader_->Lock();
    auto st   = reader_->Prepare(sql::SELECT_WAREHOUSE_BY_ID);
    BindText(st.get(), 1, warehouse_id.ToString());
    if (Step(reader_->Handle(), st.get(), "reading warehouse") == SQLITE_ROW) {
      row = ReadWarehouse(st.get());
    }
  }

  if (!row) return std::nullopt;
  return Decode(*row);
}

// ------------------------------------------------------------------
// Namespaces / tasks
// ------------------------------------------------------------------

void SqliteCatalogStore::AddNamespace(Transaction& t, const model::WarehouseId& warehouse_id,
                                      const std::string& namespace_name) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  auto st = tx.DB().Prepare(sql::BUMP_WAREHOUSE_VERSION);
  BindText(st.get(), 1, warehouse_id.ToString());
  Step(db, st.get(), "touching warehouse");
  if (sqlite3_changes(db) == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }

  auto insert = tx.DB().Prepare(sql::INSERT_NAMESPACE);
  BindText(insert.get(), 1, warehouse_id.ToString());
  BindText(insert.get(), 2, namespace_name);
  Step(db, insert.get(), "inserting namespace");
}

void SqliteCatalogStore::EnqueueTask(Transaction& t, const model::WarehouseId& warehouse_id,
                                     const std::string& task_id) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  auto st = tx.DB().Prepare(sql::BUMP_WAREHOUSE_VERSION);
  BindText(st.get(), 1, warehouse_id.ToString());
  Step(db, st.get(), "touching warehouse");
  if (sqlite3_changes(db) == 0) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }

  auto insert = tx.DB().Prepare(sql::INSERT_TASK);
  BindText(insert.get(), 1, task_id);
  BindText(insert.get(), 2, warehouse_id.ToString());
  Step(db, insert.get(), "inserting task");
}

void SqliteCatalogStore::FinishTask(Transaction& t, const std::string& task_id) {
  auto& tx = TX(t);
  auto* db = tx.Handle();

  std::string warehouse_id;
  {
    auto st = tx.DB().Prepare(sql::DELETE_TASK_RETURNING_WAREHOUSE);
    BindText(st.get(), 1, task_id);
    if (Step(db, st.get(), "deleting task") != SQLITE_ROW) {
      throw error::CatalogBackendError::Unexpected("task '" + task_id + "' not found");
    }
    warehouse_id = ColText(st.get(), 0);
    // RETURNING rows must be stepped to completion before the delete is final
    while (Step(db, st.get(), "deleting task") == SQLITE_ROW) {
    }
  }

  auto st = tx.DB().Prepare(sql::BUMP_WAREHOUSE_VERSION);
  BindText(st.get(), 1, warehouse_id);
  Step(db, st.get(), "touching warehouse");
}

} // namespace catalog::db::sqlite
