#pragma once

#include <memory>

#include "internal/db/api/catalog_store.hpp"
#include "internal/db/model/warehouse_record.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace catalog::db::sqlite {

/*
  SQLite catalog store.

  Writes go through the writer connection inside BEGIN IMMEDIATE
  transactions, so writers are serialized and never lose a race. Reads use
  a second connection on the same file and only ever see committed data.
*/
class SqliteCatalogStore final : public db::CatalogStore {
public:
  SqliteCatalogStore(std::shared_ptr<SqliteDB> writer, std::shared_ptr<SqliteDB> reader);

  // Opens both connections on path.
  static std::shared_ptr<SqliteCatalogStore> Open(const std::string& path, bool wal_mode);

  // Creates the catalog tables if missing.
  void ApplySchema();

  std::unique_ptr<Transaction> Begin() override;

  void CreateProject(Transaction&, const model::ProjectId&, const std::string& name) override;

  model::WarehouseId CreateWarehouse(Transaction&, const std::string& warehouse_name,
                                     const model::ProjectId& project_id,
                                     const catalog::v1::StorageProfile& storage_profile,
                                     const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                     const std::optional<model::SecretIdent>& storage_secret_id) override;
  void DeleteWarehouse(Transaction&, const model::WarehouseId&, const catalog::v1::DeleteWarehouseQuery&) override;
  void RenameWarehouse(Transaction&, const model::WarehouseId&, const std::string& new_name) override;
  void SetWarehouseStatus(Transaction&, const model::WarehouseId&, model::WarehouseStatus) override;
  void SetWarehouseProtected(Transaction&, const model::WarehouseId&, bool is_protected) override;

  std::vector<model::GetWarehouseResponse> ListWarehouses(
      const model::ProjectId&, const std::vector<model::WarehouseStatus>& statuses) override;
  std::optional<model::GetWarehouseResponse> GetWarehouseById(const model::WarehouseId&) override;

  void AddNamespace(Transaction&, const model::WarehouseId&, const std::string& namespace_name);
  void EnqueueTask(Transaction&, const model::WarehouseId&, const std::string& task_id);
  void FinishTask(Transaction&, const std::string& task_id);

private:
  static SqliteTransaction& TX(Transaction& t);

  std::shared_ptr<SqliteDB> writer_;
  std::shared_ptr<SqliteDB> reader_;
};

}
