#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/error/error_model.hpp"
#include "internal/model/ids.hpp"

namespace {

using namespace catalog::error;
using catalog::model::ProjectId;
using catalog::model::WarehouseId;

void TestDomainErrorMappings() {
  const auto warehouse_id = WarehouseId::Generate();
  const auto project_id   = ProjectId::Generate();

  auto not_found = ToErrorModel(WarehouseIdNotFound(warehouse_id));
  assert(not_found.type() == "WarehouseNotFound");
  assert(not_found.code() == 404);
  assert(not_found.message() == "A warehouse with id '" + warehouse_id.ToString() + "' does not exist");

  auto exists = ToErrorModel(WarehouseAlreadyExists("sales", project_id));
  assert(exists.type() == "WarehouseAlreadyExists");
  assert(exists.code() == 409);
  assert(exists.message() ==
         "A warehouse with the name 'sales' already exists in project with id '" + project_id.ToString() + "'");

  auto project = ToErrorModel(ProjectIdNotFoundError(project_id));
  assert(project.type() == "ProjectNotFound");
  assert(project.code() == 404);
  assert(project.message() == "Project with id '" + project_id.ToString() + "' not found");

  auto tasks = ToErrorModel(WarehouseHasUnfinishedTasks());
  assert(tasks.type() == "WarehouseHasUnfinishedTasks");
  assert(tasks.code() == 409);

  auto not_empty = ToErrorModel(WarehouseNotEmpty());
  assert(not_empty.type() == "WarehouseNotEmpty");
  assert(not_empty.code() == 409);

  auto protected_model = ToErrorModel(WarehouseProtected());
  assert(protected_model.type() == "WarehouseProtected");
  assert(protected_model.code() == 409);
  assert(protected_model.message() ==
         "Warehouse is protected and force flag not set. Cannot delete protected warehouse.");
}

void TestBackendClassificationDrivesStatus() {
  const auto unexpected = ToErrorModel(CatalogBackendError::Unexpected("same message"));
  const auto conflict   = ToErrorModel(CatalogBackendError::ConcurrentModification("same message"));

  assert(unexpected.type() == "CatalogBackendError");
  assert(conflict.type() == "CatalogBackendError");
  assert(unexpected.code() == 500);
  assert(conflict.code() == 409);
  assert(unexpected.code() != 503);
  assert(unexpected.message() == "Catalog backend error (Unexpected): same message");
  assert(!unexpected.has_source());
}

void TestIntegrityAndSerializationErrors() {
  const auto integrity = ToErrorModel(DatabaseIntegrityError("bad row"));
  assert(integrity.type() == "DatabaseIntegrityError");
  assert(integrity.code() == 500);
  assert(integrity.message() == "Database integrity error: bad row");

  const ErrorCause cause("invalid utf-8", std::make_shared<ErrorCause>("byte 0xff"));
  const auto       serialization = ToErrorModel(StorageProfileSerializationError(cause));
  assert(serialization.type() == "StorageProfileSerializationError");
  assert(serialization.code() == 500);
  assert(serialization.message() == "Error serializing storage profile: invalid utf-8");
  assert(serialization.has_source());
  assert(serialization.source().message() == "invalid utf-8");
  assert(serialization.source().source().message() == "byte 0xff");
}

void TestStackIsCarried() {
  DeleteWarehouseError op(WarehouseNotEmpty().AppendDetail("store"));
  const auto           model = ToErrorModel(op);

  assert(model.type() == "WarehouseNotEmpty");
  assert(model.stack_size() == 2);
  assert(model.stack(0) == "store");
  assert(model.stack(1) == "Error deleting warehouse in catalog");
}

void TestDynamicDispatch() {
  const auto id = WarehouseId::Generate();

  const GetWarehouseByIdError op = WarehouseIdNotFound(id);
  const std::exception&       as_exception = op;
  const auto                  model        = ToErrorModel(as_exception);
  assert(model.type() == "WarehouseNotFound");
  assert(model.code() == 404);
  assert(model.stack(0) == "Error getting warehouse by id in catalog");

  const CatalogBackendError backend = CatalogBackendError::ConcurrentModification("raced");
  assert(ToErrorModel(static_cast<const std::exception&>(backend)).code() == 409);

  const auto fallback = ToErrorModel(std::runtime_error("unexpected"));
  assert(fallback.type() == "InternalServerError");
  assert(fallback.code() == 500);
  assert(fallback.message() == "unexpected");
}

void TestIcebergEnvelopeJson() {
  auto model = ToErrorModel(WarehouseProtected().AppendDetail("ctx"));
  auto json  = ToJson(ToIcebergErrorResponse(model));

  assert(json.find("\"error\"") != std::string::npos);
  assert(json.find("\"type\":\"WarehouseProtected\"") != std::string::npos);
  assert(json.find("\"code\":409") != std::string::npos);
  assert(json.find("\"stack\":[\"ctx\"]") != std::string::npos);
}

} // namespace

int main() {
  TestDomainErrorMappings();
  TestBackendClassificationDrivesStatus();
  TestIntegrityAndSerializationErrors();
  TestStackIsCarried();
  TestDynamicDispatch();
  TestIcebergEnvelopeJson();

  std::cout << "catalog_manager_unit_error_model: pass\n";
  return 0;
}
