#pragma once

#include <exception>
#include <string>
#include <variant>

#include "catalog/management/v1.hpp"
#include "internal/error/warehouse_operation_errors.hpp"

namespace catalog::error {

/*
  Wire translation.

  Every catalog error converts into catalog::v1::ErrorModel, the only error
  representation that crosses a protocol boundary:

    CatalogBackendError (Unexpected)              CatalogBackendError              500
    CatalogBackendError (ConcurrentModification)  CatalogBackendError              409
    DatabaseIntegrityError                        DatabaseIntegrityError           500
    WarehouseIdNotFound                           WarehouseNotFound                404
    WarehouseAlreadyExists                        WarehouseAlreadyExists           409
    ProjectIdNotFoundError                        ProjectNotFound                  404
    StorageProfileSerializationError              StorageProfileSerializationError 500 (+ source)
    WarehouseHasUnfinishedTasks                   WarehouseHasUnfinishedTasks      409
    WarehouseNotEmpty                             WarehouseNotEmpty                409
    WarehouseProtected                            WarehouseProtected               409

  Backend failures are never reported as 503: older Iceberg clients retry
  503 automatically, which can repeat side effects.
*/

catalog::v1::ErrorModel ToErrorModel(const CatalogBackendError& err);
catalog::v1::ErrorModel ToErrorModel(const DatabaseIntegrityError& err);
catalog::v1::ErrorModel ToErrorModel(const WarehouseIdNotFound& err);
catalog::v1::ErrorModel ToErrorModel(const WarehouseAlreadyExists& err);
catalog::v1::ErrorModel ToErrorModel(const ProjectIdNotFoundError& err);
catalog::v1::ErrorModel ToErrorModel(const StorageProfileSerializationError& err);
catalog::v1::ErrorModel ToErrorModel(const WarehouseHasUnfinishedTasks& err);
catalog::v1::ErrorModel ToErrorModel(const WarehouseNotEmpty& err);
catalog::v1::ErrorModel ToErrorModel(const WarehouseProtected& err);

template <const char* Context, typename... Errors>
catalog::v1::ErrorModel ToErrorModel(const OperationError<Context, Errors...>& err) {
  return std::visit([](const auto& e) { return ToErrorModel(e); }, err.Error());
}

// Dispatches any catalog error by dynamic type; anything else is a 500.
catalog::v1::ErrorModel ToErrorModel(const std::exception& e);

catalog::v1::ErrorCause ToProto(const ErrorCause& cause);

catalog::v1::IcebergErrorResponse ToIcebergErrorResponse(catalog::v1::ErrorModel model);

// protobuf JSON with proto field names
std::string ToJson(const catalog::v1::ErrorModel& model);
std::string ToJson(const catalog::v1::IcebergErrorResponse& response);

} // namespace catalog::error
