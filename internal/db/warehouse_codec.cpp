#include "warehouse_codec.hpp"

#include <google/protobuf/stubs/common.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>

#include "internal/error/backend_error.hpp"
#include "internal/error/warehouse_errors.hpp"

namespace catalog::db {

namespace {

constexpr const char* kHardDelete = "hard";
constexpr const char* kSoftDelete = "soft";

template <typename Id>
Id DecodeId(const std::string& text, const char* column, const std::string& warehouse_id) {
  try {
    return Id::FromString(text);
  } catch (const std::invalid_argument& e) {
    throw error::DatabaseIntegrityError("warehouse '" + warehouse_id + "' has malformed " + column + ": " + e.what());
  }
}

catalog::v1::StorageProfile DecodeStorageProfile(const WarehouseRecord& record) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  catalog::v1::StorageProfile profile;
  auto status = google::protobuf::util::JsonStringToMessage(record.storage_profile, &profile, options);
  if (!status.ok()) {
    throw error::DatabaseIntegrityError("could not parse storage profile of warehouse '" + record.warehouse_id +
                                        "': " + status.ToString());
  }
  return profile;
}

catalog::v1::TabularDeleteProfile DecodeTabularDeleteProfile(const WarehouseRecord& record) {
  catalog::v1::TabularDeleteProfile profile;
  if (record.tabular_delete_mode == kHardDelete) {
    profile.mutable_hard();
  } else if (record.tabular_delete_mode == kSoftDelete) {
    profile.mutable_soft()->set_expiration_seconds(record.tabular_expiration_seconds);
  } else {
    throw error::DatabaseIntegrityError("warehouse '" + record.warehouse_id + "' has unknown tabular delete mode '" +
                                        record.tabular_delete_mode + "'");
  }
  return profile;
}

void RequireUtf8(const std::string& text, const std::string& path) {
  if (!google::protobuf::internal::IsStructurallyValidUTF8(text.data(), static_cast<int>(text.size()))) {
    throw error::StorageProfileSerializationError(
        error::ErrorCause("storage profile field '" + path + "' is not valid UTF-8"));
  }
}

void RequireEncodable(const google::protobuf::Struct& config, const std::string& path);

// The JSON printer writes non-finite numbers as strings and replaces invalid
// UTF-8 with an empty string, so both are rejected before printing.
void RequireEncodable(const google::protobuf::Value& value, const std::string& path) {
  switch (value.kind_case()) {
  case google::protobuf::Value::kStringValue:
    RequireUtf8(value.string_value(), path);
    break;
  case google::protobuf::Value::kNumberValue:
    if (!std::isfinite(value.number_value())) {
      throw error::StorageProfileSerializationError(
          error::ErrorCause("storage profile field '" + path + "' is not a finite number"));
    }
    break;
  case google::protobuf::Value::kStructValue:
    RequireEncodable(value.struct_value(), path);
    break;
  case google::protobuf::Value::kListValue:
    for (int i = 0; i < value.list_value().values_size(); ++i) {
      RequireEncodable(value.list_value().values(i), path + "[" + std::to_string(i) + "]");
    }
    break;
  default:
    break;
  }
}

void RequireEncodable(const google::protobuf::Struct& config, const std::string& path) {
  for (const auto& [key, value] : config.fields()) {
    RequireUtf8(key, path);
    RequireEncodable(value, path + "." + key);
  }
}

} // namespace

std::string SerializeStorageProfile(const catalog::v1::StorageProfile& profile) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  RequireUtf8(profile.storage_type(), "storage_type");
  RequireEncodable(profile.config(), "config");

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(profile, &json, options);
  if (!status.ok()) {
    throw error::StorageProfileSerializationError(error::ErrorCause(status.ToString()));
  }
  return json;
}

WarehouseRecord EncodeWarehouse(const model::WarehouseId& warehouse_id, const std::string& warehouse_name,
                                const model::ProjectId& project_id,
                                const catalog::v1::StorageProfile& storage_profile,
                                const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                const std::optional<model::SecretIdent>& storage_secret_id) {
  WarehouseRecord record;
  record.warehouse_id    = warehouse_id.ToString();
  record.warehouse_name  = warehouse_name;
  record.project_id      = project_id.ToString();
  record.storage_profile = SerializeStorageProfile(storage_profile);
  if (storage_secret_id) {
    record.storage_secret_id = storage_secret_id->ToString();
  }
  record.status = std::string(model::ToString(model::WarehouseStatus::kActive));

  // unset profile means hard delete
  if (tabular_delete_profile.has_soft()) {
    record.tabular_delete_mode        = kSoftDelete;
    record.tabular_expiration_seconds = tabular_delete_profile.soft().expiration_seconds();
  } else {
    record.tabular_delete_mode = kHardDelete;
  }
  return record;
}

model::GetWarehouseResponse DecodeWarehouse(const WarehouseRecord& record) {
  model::GetWarehouseResponse warehouse;
  warehouse.id         = DecodeId<model::WarehouseId>(record.warehouse_id, "id", record.warehouse_id);
  warehouse.name       = record.warehouse_name;
  warehouse.project_id = DecodeId<model::ProjectId>(record.project_id, "project id", record.warehouse_id);

  if (!record.storage_secret_id.empty()) {
    warehouse.storage_secret_id =
        DecodeId<model::SecretIdent>(record.storage_secret_id, "storage secret id", record.warehouse_id);
  }

  auto status = model::ParseWarehouseStatus(record.status);
  if (!status) {
    throw error::DatabaseIntegrityError("warehouse '" + record.warehouse_id + "' has unknown status '" +
                                        record.status + "'");
  }
  warehouse.status = *status;

  warehouse.storage_profile        = DecodeStorageProfile(record);
  warehouse.tabular_delete_profile = DecodeTabularDeleteProfile(record);
  warehouse.is_protected           = record.is_protected;
  return warehouse;
}

} // namespace catalog::db
