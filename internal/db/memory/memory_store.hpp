#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "internal/db/api/catalog_store.hpp"
#include "internal/db/model/warehouse_record.hpp"

namespace catalog::db::memory {

class MemoryTransaction;

/*
  In-process catalog store.

  Transactions work on a snapshot of the committed state and are validated
  on commit against the versions of every row they touched; a lost race is
  a ConcurrentModification.
*/
class MemoryCatalogStore final : public db::CatalogStore {
public:
  MemoryCatalogStore();

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

  // Namespaces and background tasks are owned by other parts of the
  // catalog; these seed the rows the delete guards inspect.
  void AddNamespace(Transaction&, const model::WarehouseId&, const std::string& namespace_name);
  void EnqueueTask(Transaction&, const model::WarehouseId&, const std::string& task_id);
  void FinishTask(Transaction&, const std::string& task_id);

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, std::string>           projects;    // project id -> name
    std::map<std::string, WarehouseRecord>       warehouses;  // warehouse id -> row
    std::map<std::string, std::set<std::string>> namespaces;  // warehouse id -> namespace names
    std::map<std::string, std::string>           tasks;       // unfinished task id -> warehouse id
  };

  std::mutex mutex_;
  State      committed_;
};

}
