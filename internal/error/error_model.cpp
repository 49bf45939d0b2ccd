#include "error_model.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <stdexcept>

namespace catalog::error {

namespace {

constexpr uint32_t kNotFound            = 404;
constexpr uint32_t kConflict            = 409;
constexpr uint32_t kInternalServerError = 500;

template <typename E>
catalog::v1::ErrorModel MakeModel(const char* type, uint32_t code, const std::string& message, const E& err) {
  catalog::v1::ErrorModel model;
  model.set_type(type);
  model.set_code(code);
  model.set_message(message);
  for (const auto& detail : err.Stack()) {
    model.add_stack(detail);
  }
  return model;
}

template <typename E>
bool TryConvert(const std::exception& e, catalog::v1::ErrorModel& out) {
  if (const auto* typed = dynamic_cast<const E*>(&e)) {
    out = ToErrorModel(*typed);
    return true;
  }
  return false;
}

template <typename... Es>
bool TryConvertAny(const std::exception& e, catalog::v1::ErrorModel& out) {
  return (TryConvert<Es>(e, out) || ...);
}

std::string PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render error as JSON: " + status.ToString());
  }
  return json;
}

} // namespace

catalog::v1::ErrorModel ToErrorModel(const CatalogBackendError& err) {
  const auto code = err.Type() == BackendErrorType::kConcurrentModification ? kConflict : kInternalServerError;
  return MakeModel("CatalogBackendError", code, err.what(), err);
}

catalog::v1::ErrorModel ToErrorModel(const DatabaseIntegrityError& err) {
  return MakeModel("DatabaseIntegrityError", kInternalServerError, "Database integrity error: " + err.Message(), err);
}

catalog::v1::ErrorModel ToErrorModel(const WarehouseIdNotFound& err) {
  return MakeModel("WarehouseNotFound", kNotFound, err.what(), err);
}

catalog::v1::ErrorModel ToErrorModel(const WarehouseAlreadyExists& err) {
  return MakeModel("WarehouseAlreadyExists", kConflict, err.what(), err);
}

catalog::v1::ErrorModel ToErrorModel(const ProjectIdNotFoundError& err) {
  return MakeModel("ProjectNotFound", kNotFound, err.what(), err);
}

catalog::v1::ErrorModel ToErrorModel(const StorageProfileSerializationError& err) {
  auto model = MakeModel("StorageProfileSerializationError", kInternalServerError, err.what(), err);
  *model.mutable_source() = ToProto(err.Source());
  return model;
}

catalog::v1::ErrorModel ToErrorModel(const WarehouseHasUnfinishedTasks& err) {
  return MakeModel("WarehouseHasUnfinishedTasks", kConflict, err.what(), err);
}

catalog::v1::ErrorModel ToErrorModel(const WarehouseNotEmpty& err) {
  return MakeModel("WarehouseNotEmpty", kConflict, err.what(), err);
}

catalog::v1::ErrorModel ToErrorModel(const WarehouseProtected& err) {
  return MakeModel("WarehouseProtected", kConflict, err.what(), err);
}

catalog::v1::ErrorModel ToErrorModel(const std::exception& e) {
  catalog::v1::ErrorModel model;
  const bool converted =
      TryConvertAny<CreateProjectError, CreateWarehouseError, DeleteWarehouseError, RenameWarehouseError,
                    ListWarehousesError, GetWarehouseByIdError, SetWarehouseStatusError, SetWarehouseProtectedError,
                    GetStorageConfigError, CatalogBackendError, DatabaseIntegrityError, WarehouseIdNotFound,
                    WarehouseAlreadyExists, ProjectIdNotFoundError, StorageProfileSerializationError,
                    WarehouseHasUnfinishedTasks, WarehouseNotEmpty, WarehouseProtected>(e, model);
  if (converted) {
    return model;
  }

  model.set_type("InternalServerError");
  model.set_code(kInternalServerError);
  model.set_message(e.what());
  return model;
}

catalog::v1::ErrorCause ToProto(const ErrorCause& cause) {
  catalog::v1::ErrorCause proto;
  proto.set_message(cause.Message());
  if (const auto* source = cause.Source()) {
    *proto.mutable_source() = ToProto(*source);
  }
  return proto;
}

catalog::v1::IcebergErrorResponse ToIcebergErrorResponse(catalog::v1::ErrorModel model) {
  catalog::v1::IcebergErrorResponse response;
  *response.mutable_error() = std::move(model);
  return response;
}

std::string ToJson(const catalog::v1::ErrorModel& model) {
  return PrintJson(model);
}

std::string ToJson(const catalog::v1::IcebergErrorResponse& response) {
  return PrintJson(response);
}

} // namespace catalog::error
