#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/model/ids.hpp"
#include "internal/model/warehouse.hpp"
#include "catalog/management/v1.hpp"

namespace catalog::db {

/*
  Catalog store abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction handed in by the caller; the store
    never commits or rolls it back
  - Write preconditions are evaluated inside that transaction
  - Reads take no transaction and observe committed state only
  - Failures are raised as catalog::error domain errors or
    CatalogBackendError, never as backend native exceptions

  The DB is the source of truth for:
    projects
    warehouses
    the namespaces and tasks that guard warehouse deletion
*/

class CatalogStore {
 public:
  virtual ~CatalogStore() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Projects
  // ---------------------------------------------------------------------

  virtual void CreateProject(Transaction&, const model::ProjectId& project_id, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Warehouse lifecycle
  // ---------------------------------------------------------------------

  // Throws WarehouseAlreadyExists, ProjectIdNotFoundError,
  // StorageProfileSerializationError, CatalogBackendError.
  virtual model::WarehouseId CreateWarehouse(Transaction&, const std::string& warehouse_name,
                                             const model::ProjectId& project_id,
                                             const catalog::v1::StorageProfile& storage_profile,
                                             const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                             const std::optional<model::SecretIdent>& storage_secret_id) = 0;

  // Guards, in order: WarehouseIdNotFound, WarehouseHasUnfinishedTasks,
  // WarehouseProtected (unless force), WarehouseNotEmpty (unless force).
  virtual void DeleteWarehouse(Transaction&, const model::WarehouseId& warehouse_id,
                               const catalog::v1::DeleteWarehouseQuery& query) = 0;

  // Active warehouses only.
  virtual void RenameWarehouse(Transaction&, const model::WarehouseId& warehouse_id, const std::string& new_name) = 0;

  virtual void SetWarehouseStatus(Transaction&, const model::WarehouseId& warehouse_id,
                                  model::WarehouseStatus status) = 0;

  virtual void SetWarehouseProtected(Transaction&, const model::WarehouseId& warehouse_id, bool is_protected) = 0;

  // Sorted by name, then id. Throws DatabaseIntegrityError on rows that do
  // not decode or reference a missing project.
  virtual std::vector<model::GetWarehouseResponse> ListWarehouses(
      const model::ProjectId& project_id, const std::vector<model::WarehouseStatus>& statuses) = 0;

  // Any status; filtering is the caller's policy.
  virtual std::optional<model::GetWarehouseResponse> GetWarehouseById(const model::WarehouseId& warehouse_id) = 0;
};

} // namespace catalog::db
