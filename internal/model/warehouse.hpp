#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/ids.hpp"
#include "catalog/management/v1.hpp"

namespace catalog::model {

/*
  Warehouse visibility status.

  Default reads only surface kActive. The numeric order is the listing
  order when statuses are sorted.
*/
enum class WarehouseStatus : std::uint8_t {
  kActive   = 0,
  kInactive = 1,
};

// kebab-case, as persisted
std::string_view ToString(WarehouseStatus status);
std::optional<WarehouseStatus> ParseWarehouseStatus(std::string_view text);

/*
  Immutable snapshot of a warehouse row.
*/
struct GetWarehouseResponse {
  WarehouseId id;
  std::string name;
  ProjectId   project_id;

  catalog::v1::StorageProfile   storage_profile;
  std::optional<SecretIdent>    storage_secret_id;
  WarehouseStatus               status = WarehouseStatus::kActive;
  catalog::v1::TabularDeleteProfile tabular_delete_profile;

  // Deletion requires DeleteWarehouseQuery.force while set.
  bool is_protected = false;
};

struct GetStorageConfigResponse {
  catalog::v1::StorageProfile storage_profile;
  std::optional<SecretIdent>  storage_secret_ident;
};

} // namespace catalog::model
