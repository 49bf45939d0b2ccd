#pragma once

#include <optional>
#include <string>
#include <vector>

#include "catalog/management/v1.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/error/warehouse_operation_errors.hpp"
#include "internal/model/ids.hpp"
#include "internal/model/warehouse.hpp"
#include "service_context.hpp"

namespace catalog::service {

/*
  Warehouse lifecycle operations on top of a CatalogStore.

  Mutations run inside the caller's transaction; the service never begins,
  commits or rolls back. Every failure is thrown as the operation's error
  type (see warehouse_operation_errors.hpp) and nothing is retried here.
*/
class WarehouseService {
public:
  explicit WarehouseService(ServiceContext ctx);

  // Throws CreateProjectError.
  void CreateProject(const model::ProjectId& project_id, const std::string& name, db::Transaction& tx);

  // Throws CreateWarehouseError.
  model::WarehouseId CreateWarehouse(const std::string& warehouse_name, const model::ProjectId& project_id,
                                     const catalog::v1::StorageProfile& storage_profile,
                                     const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                     const std::optional<model::SecretIdent>& storage_secret_id,
                                     db::Transaction& tx);

  // Throws DeleteWarehouseError.
  void DeleteWarehouse(const model::WarehouseId& warehouse_id, const catalog::v1::DeleteWarehouseQuery& query,
                       db::Transaction& tx);

  // Throws RenameWarehouseError.
  void RenameWarehouse(const model::WarehouseId& warehouse_id, const std::string& new_name, db::Transaction& tx);

  // No status set means active only; an explicit empty set matches nothing.
  // Throws ListWarehousesError.
  std::vector<model::GetWarehouseResponse> ListWarehouses(
      const model::ProjectId& project_id,
      const std::optional<std::vector<model::WarehouseStatus>>& include_status = std::nullopt);

  // Active warehouses only; nullopt when missing or inactive.
  // Throws GetWarehouseByIdError.
  std::optional<model::GetWarehouseResponse> GetWarehouse(const model::WarehouseId& warehouse_id);

  // GetWarehouse, with a missing warehouse raised as WarehouseIdNotFound.
  model::GetWarehouseResponse RequireWarehouse(const model::WarehouseId& warehouse_id);

  // Throws SetWarehouseStatusError.
  void SetWarehouseStatus(const model::WarehouseId& warehouse_id, model::WarehouseStatus status,
                          db::Transaction& tx);

  // Throws SetWarehouseProtectedError.
  void SetWarehouseProtected(const model::WarehouseId& warehouse_id, bool is_protected, db::Transaction& tx);

  // Throws GetStorageConfigError.
  model::GetStorageConfigResponse GetStorageConfig(const model::WarehouseId& warehouse_id);

private:
  ServiceContext ctx_;
};

}
