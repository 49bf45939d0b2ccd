#include "warehouse_service.hpp"

#include <string_view>

#include "internal/db/api/catalog_store.hpp"
#include "internal/observability/logging.hpp"

namespace catalog::service {

using catalog::observability::BoolField;
using catalog::observability::IdField;
using catalog::observability::StringField;

namespace {

/*
  Runs one store call as operation OpError: member errors thrown by the
  store are re-raised as OpError (which stamps the operation context) and
  every failure is logged once.
*/
template <typename OpError, typename Fn>
decltype(auto) ObserveOperation(std::string_view route, Fn&& fn) {
  try {
    return OpError::Capture(fn);
  } catch (const OpError& ex) {
    CATALOG_LOG_ERROR("catalog operation failed",
                      {StringField("route", route), StringField("error", ex.what()),
                       observability::StackField("stack", ex.Stack())});
    throw;
  } catch (const std::exception& ex) {
    CATALOG_LOG_ERROR("catalog operation failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

WarehouseService::WarehouseService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void WarehouseService::CreateProject(const model::ProjectId& project_id, const std::string& name,
                                     db::Transaction& tx) {
  ObserveOperation<error::CreateProjectError>("WarehouseService.CreateProject",
                                              [&] { ctx_.store->CreateProject(tx, project_id, name); });
  CATALOG_LOG_INFO("project created", {IdField("project_id", project_id), StringField("name", name)});
}

model::WarehouseId WarehouseService::CreateWarehouse(const std::string& warehouse_name,
                                                     const model::ProjectId& project_id,
                                                     const catalog::v1::StorageProfile& storage_profile,
                                                     const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                                     const std::optional<model::SecretIdent>& storage_secret_id,
                                                     db::Transaction& tx) {
  auto warehouse_id = ObserveOperation<error::CreateWarehouseError>("WarehouseService.CreateWarehouse", [&] {
    return ctx_.store->CreateWarehouse(tx, warehouse_name, project_id, storage_profile, tabular_delete_profile,
                                       storage_secret_id);
  });
  CATALOG_LOG_INFO("warehouse created", {IdField("warehouse_id", warehouse_id),
                                         StringField("name", warehouse_name),
                                         IdField("project_id", project_id)});
  return warehouse_id;
}

void WarehouseService::DeleteWarehouse(const model::WarehouseId& warehouse_id,
                                       const catalog::v1::DeleteWarehouseQuery& query, db::Transaction& tx) {
  ObserveOperation<error::DeleteWarehouseError>("WarehouseService.DeleteWarehouse",
                                                [&] { ctx_.store->DeleteWarehouse(tx, warehouse_id, query); });
  CATALOG_LOG_INFO("warehouse deleted", {IdField("warehouse_id", warehouse_id),
                                         BoolField("force", query.force())});
}

void WarehouseService::RenameWarehouse(const model::WarehouseId& warehouse_id, const std::string& new_name,
                                       db::Transaction& tx) {
  ObserveOperation<error::RenameWarehouseError>("WarehouseService.RenameWarehouse",
                                                [&] { ctx_.store->RenameWarehouse(tx, warehouse_id, new_name); });
  CATALOG_LOG_INFO("warehouse renamed",
                   {IdField("warehouse_id", warehouse_id), StringField("name", new_name)});
}

std::vector<model::GetWarehouseResponse> WarehouseService::ListWarehouses(
    const model::ProjectId& project_id, const std::optional<std::vector<model::WarehouseStatus>>& include_status) {
  const auto statuses = include_status.value_or(std::vector<model::WarehouseStatus>{model::WarehouseStatus::kActive});
  return ObserveOperation<error::ListWarehousesError>("WarehouseService.ListWarehouses", [&] {
    return ctx_.store->ListWarehouses(project_id, statuses);
  });
}

std::optional<model::GetWarehouseResponse> WarehouseService::GetWarehouse(const model::WarehouseId& warehouse_id) {
  auto warehouse = ObserveOperation<error::GetWarehouseByIdError>(
      "WarehouseService.GetWarehouse", [&] { return ctx_.store->GetWarehouseById(warehouse_id); });

  if (warehouse && warehouse->status != model::WarehouseStatus::kActive) {
    return std::nullopt;
  }
  return warehouse;
}

model::GetWarehouseResponse WarehouseService::RequireWarehouse(const model::WarehouseId& warehouse_id) {
  auto warehouse = GetWarehouse(warehouse_id);
  if (!warehouse) {
    throw error::GetWarehouseByIdError(error::WarehouseIdNotFound(warehouse_id));
  }
  return std::move(*warehouse);
}

void WarehouseService::SetWarehouseStatus(const model::WarehouseId& warehouse_id, model::WarehouseStatus status,
                                          db::Transaction& tx) {
  ObserveOperation<error::SetWarehouseStatusError>("WarehouseService.SetWarehouseStatus", [&] {
    ctx_.store->SetWarehouseStatus(tx, warehouse_id, status);
  });
  CATALOG_LOG_INFO("warehouse status changed", {IdField("warehouse_id", warehouse_id),
                                                StringField("status", model::ToString(status))});
}

void WarehouseService::SetWarehouseProtected(const model::WarehouseId& warehouse_id, bool is_protected,
                                             db::Transaction& tx) {
  ObserveOperation<error::SetWarehouseProtectedError>("WarehouseService.SetWarehouseProtected", [&] {
    ctx_.store->SetWarehouseProtected(tx, warehouse_id, is_protected);
  });
  CATALOG_LOG_INFO("warehouse protection changed", {IdField("warehouse_id", warehouse_id),
                                                    BoolField("protected", is_protected)});
}

model::GetStorageConfigResponse WarehouseService::GetStorageConfig(const model::WarehouseId& warehouse_id) {
  auto warehouse = ObserveOperation<error::GetStorageConfigError>(
      "WarehouseService.GetStorageConfig", [&] { return ctx_.store->GetWarehouseById(warehouse_id); });

  if (!warehouse || warehouse->status != model::WarehouseStatus::kActive) {
    throw error::GetStorageConfigError(error::WarehouseIdNotFound(warehouse_id));
  }

  model::GetStorageConfigResponse response;
  response.storage_profile      = std::move(warehouse->storage_profile);
  response.storage_secret_ident = warehouse->storage_secret_id;
  return response;
}

}
