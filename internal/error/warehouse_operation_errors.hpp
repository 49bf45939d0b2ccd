#pragma once

#include "internal/error/backend_error.hpp"
#include "internal/error/operation_error.hpp"
#include "internal/error/warehouse_errors.hpp"

namespace catalog::error {

inline constexpr char kCreateProjectContext[]         = "Error creating project in catalog";
inline constexpr char kCreateWarehouseContext[]       = "Error creating warehouse in catalog";
inline constexpr char kDeleteWarehouseContext[]       = "Error deleting warehouse in catalog";
inline constexpr char kRenameWarehouseContext[]       = "Error renaming warehouse in catalog";
inline constexpr char kListWarehousesContext[]        = "Error listing warehouses in catalog";
inline constexpr char kGetWarehouseContext[]          = "Error getting warehouse by id in catalog";
inline constexpr char kSetWarehouseStatusContext[]    = "Error setting warehouse status in catalog";
inline constexpr char kSetWarehouseProtectedContext[] = "Error setting warehouse protection in catalog";
inline constexpr char kGetStorageConfigContext[]      = "Error getting storage config in catalog";

using CreateProjectError = OperationError<kCreateProjectContext, CatalogBackendError>;

using CreateWarehouseError = OperationError<kCreateWarehouseContext, WarehouseAlreadyExists, CatalogBackendError,
                                            StorageProfileSerializationError, ProjectIdNotFoundError>;

using DeleteWarehouseError = OperationError<kDeleteWarehouseContext, CatalogBackendError, WarehouseHasUnfinishedTasks,
                                            WarehouseIdNotFound, WarehouseNotEmpty, WarehouseProtected>;

// A new-name collision is reported by backends as CatalogBackendError.
using RenameWarehouseError = OperationError<kRenameWarehouseContext, CatalogBackendError, WarehouseIdNotFound>;

using ListWarehousesError = OperationError<kListWarehousesContext, CatalogBackendError, DatabaseIntegrityError>;

// Shared by get and require; require adds WarehouseIdNotFound for a missing row.
using GetWarehouseByIdError =
    OperationError<kGetWarehouseContext, CatalogBackendError, DatabaseIntegrityError, WarehouseIdNotFound>;

using SetWarehouseStatusError = OperationError<kSetWarehouseStatusContext, CatalogBackendError, WarehouseIdNotFound>;

using SetWarehouseProtectedError =
    OperationError<kSetWarehouseProtectedContext, CatalogBackendError, WarehouseIdNotFound>;

using GetStorageConfigError =
    OperationError<kGetStorageConfigContext, CatalogBackendError, DatabaseIntegrityError, WarehouseIdNotFound>;

} // namespace catalog::error
