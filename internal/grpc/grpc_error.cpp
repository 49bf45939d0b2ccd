#include "grpc_error.hpp"

#include "internal/error/error_model.hpp"

namespace catalog::grpc {

::grpc::StatusCode ToStatusCode(const catalog::v1::ErrorModel& model) {
  switch (model.code()) {
    case 404:
      return ::grpc::StatusCode::NOT_FOUND;
    case 409:
      if (model.type() == "WarehouseAlreadyExists") {
        return ::grpc::StatusCode::ALREADY_EXISTS;
      }
      // lost optimistic race: retry the whole operation
      if (model.type() == "CatalogBackendError") {
        return ::grpc::StatusCode::ABORTED;
      }
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    default:
      // Never UNAVAILABLE, for the same client retry reason as the HTTP 500 mapping.
      return ::grpc::StatusCode::INTERNAL;
  }
}

::grpc::Status ToStatus(const catalog::v1::ErrorModel& model) {
  return {ToStatusCode(model), model.message(), model.SerializeAsString()};
}

::grpc::Status ToStatus(const std::exception& e) {
  return ToStatus(catalog::error::ToErrorModel(e));
}

} // namespace catalog::grpc
