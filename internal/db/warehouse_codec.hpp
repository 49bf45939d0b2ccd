#pragma once

#include <optional>
#include <string>

#include "internal/db/model/warehouse_record.hpp"
#include "internal/model/warehouse.hpp"

namespace catalog::db {

/*
  Row <-> domain conversion shared by all backends.
*/

// Throws StorageProfileSerializationError.
std::string SerializeStorageProfile(const catalog::v1::StorageProfile& profile);

// Throws StorageProfileSerializationError.
WarehouseRecord EncodeWarehouse(const model::WarehouseId& warehouse_id, const std::string& warehouse_name,
                                const model::ProjectId& project_id,
                                const catalog::v1::StorageProfile& storage_profile,
                                const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                const std::optional<model::SecretIdent>& storage_secret_id);

// Throws DatabaseIntegrityError.
model::GetWarehouseResponse DecodeWarehouse(const WarehouseRecord& record);

} // namespace catalog::db
