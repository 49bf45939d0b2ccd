#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_store.hpp"
#include "internal/error/warehouse_operation_errors.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/warehouse_service.hpp"

namespace {

using catalog::db::sqlite::SqliteCatalogStore;
using catalog::db::sqlite::SqliteDB;
using catalog::error::DatabaseIntegrityError;
using catalog::model::ProjectId;
using catalog::model::WarehouseId;
using catalog::model::WarehouseStatus;
using catalog::service::WarehouseService;

uint64_t NowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct Fixture {
  std::string                         path;
  std::shared_ptr<SqliteCatalogStore> store;
  std::unique_ptr<WarehouseService>   service;

  Fixture() {
    path  = (std::filesystem::temp_directory_path() / ("catalog_manager_sqlite_store_" + std::to_string(NowNs()) + ".db")).string();
    store = SqliteCatalogStore::Open(path, true);
    store->ApplySchema();
    service = std::make_unique<WarehouseService>(catalog::service::ServiceContext{store});
  }

  ~Fixture() {
    service.reset();
    store.reset();
    for (const char* suffix : {"", "-wal", "-shm"}) {
      std::filesystem::remove(path + suffix);
    }
  }

  ProjectId AddProject() {
    const auto project = ProjectId::Generate();
    auto       tx      = store->Begin();
    service->CreateProject(project, "project", *tx);
    tx->Commit();
    return project;
  }

  WarehouseId Create(const std::string& name, const ProjectId& project) {
    catalog::v1::StorageProfile profile;
    profile.set_storage_type("s3");
    catalog::v1::TabularDeleteProfile delete_profile;
    delete_profile.mutable_hard();

    auto tx = store->Begin();
    auto id = service->CreateWarehouse(name, project, profile, delete_profile, std::nullopt, *tx);
    tx->Commit();
    return id;
  }

  // Second connection with foreign keys off, for writing rows the store
  // itself would never produce.
  void InsertRaw(const std::string& warehouse_id, const std::string& project_id, const std::string& profile,
                 const std::string& status, const std::string& delete_mode = "hard") {
    SqliteDB raw(path);
    raw.Exec("PRAGMA foreign_keys=OFF;");
    raw.Exec("INSERT INTO warehouse(warehouse_id,warehouse_name,project_id,storage_profile,status,tabular_delete_mode) VALUES('" +
             warehouse_id + "','raw-" + warehouse_id + "','" + project_id + "','" + profile + "','" + status + "','" +
             delete_mode + "');");
  }
};

constexpr const char* kValidProfile = R"({"storage_type":"s3"})";

void TestCreateGetAndUniqueName() {
  Fixture    f;
  const auto project = f.AddProject();
  const auto id      = f.Create("sales", project);

  const auto warehouse = f.service->RequireWarehouse(id);
  assert(warehouse.name == "sales");
  assert(warehouse.project_id == project);
  assert(warehouse.storage_profile.storage_type() == "s3");
  assert(warehouse.tabular_delete_profile.has_hard());

  bool caught = false;
  try {
    f.Create("sales", project);
  } catch (const catalog::error::CreateWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseAlreadyExists>());
    assert(e.As<catalog::error::WarehouseAlreadyExists>().Project() == project);
  }
  assert(caught);
}

void TestCreateInMissingProject() {
  Fixture f;

  bool caught = false;
  try {
    f.Create("sales", ProjectId::Generate());
  } catch (const catalog::error::CreateWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::ProjectIdNotFoundError>());
  }
  assert(caught);
}

void TestUncommittedWritesAreInvisible() {
  Fixture    f;
  const auto project = f.AddProject();

  catalog::v1::StorageProfile       profile;
  catalog::v1::TabularDeleteProfile delete_profile;

  auto       tx = f.store->Begin();
  const auto id = f.service->CreateWarehouse("pending", project, profile, delete_profile, std::nullopt, *tx);
  assert(!f.service->GetWarehouse(id));
  tx->Commit();
  assert(f.service->GetWarehouse(id));
}

void TestRollbackOnDestruction() {
  Fixture    f;
  const auto project = f.AddProject();
  const auto id      = f.Create("sales", project);

  {
    auto tx = f.store->Begin();
    f.service->RenameWarehouse(id, "renamed", *tx);
  }
  assert(f.service->RequireWarehouse(id).name == "sales");
}

void TestDeleteGuards() {
  Fixture    f;
  const auto project = f.AddProject();
  const auto id      = f.Create("sales", project);

  {
    auto tx = f.store->Begin();
    f.store->EnqueueTask(*tx, id, "task-1");
    f.store->AddNamespace(*tx, id, "finance");
    tx->Commit();
  }

  catalog::v1::DeleteWarehouseQuery force;
  force.set_force(true);

  bool tasks = false;
  try {
    auto tx = f.store->Begin();
    f.service->DeleteWarehouse(id, force, *tx);
  } catch (const catalog::error::DeleteWarehouseError& e) {
    tasks = true;
    assert(e.Is<catalog::error::WarehouseHasUnfinishedTasks>());
  }
  assert(tasks);
  assert(f.service->GetWarehouse(id));

  {
    auto tx = f.store->Begin();
    f.store->FinishTask(*tx, "task-1");
    tx->Commit();
  }

  bool not_empty = false;
  try {
    auto tx = f.store->Begin();
    f.service->DeleteWarehouse(id, catalog::v1::DeleteWarehouseQuery(), *tx);
  } catch (const catalog::error::DeleteWarehouseError& e) {
    not_empty = true;
    assert(e.Is<catalog::error::WarehouseNotEmpty>());
  }
  assert(not_empty);

  auto tx = f.store->Begin();
  f.service->DeleteWarehouse(id, force, *tx);
  tx->Commit();
  assert(!f.service->GetWarehouse(id));
}

void TestUnknownStatusIsIntegrityError() {
  Fixture    f;
  const auto project = f.AddProject();
  const auto id      = WarehouseId::Generate();
  f.InsertRaw(id.ToString(), project.ToString(), kValidProfile, "deleted");

  bool raw = false;
  try {
    (void)f.store->GetWarehouseById(id);
  } catch (const DatabaseIntegrityError& e) {
    raw = true;
    assert(e.Message().find("deleted") != std::string::npos);
  }
  assert(raw);

  bool wrapped = false;
  try {
    (void)f.service->GetWarehouse(id);
  } catch (const catalog::error::GetWarehouseByIdError& e) {
    wrapped = true;
    assert(e.Is<DatabaseIntegrityError>());
    assert(e.Stack().back() == "Error getting warehouse by id in catalog");
  }
  assert(wrapped);
}

void TestUnparseableProfileIsIntegrityError() {
  Fixture    f;
  const auto project = f.AddProject();
  f.InsertRaw(WarehouseId::Generate().ToString(), project.ToString(), "{not json", "active");

  bool caught = false;
  try {
    (void)f.service->ListWarehouses(project);
  } catch (const catalog::error::ListWarehousesError& e) {
    caught = true;
    assert(e.Is<DatabaseIntegrityError>());
  }
  assert(caught);
}

void TestUnknownDeleteModeIsIntegrityError() {
  Fixture    f;
  const auto project = f.AddProject();
  const auto id      = WarehouseId::Generate();
  f.InsertRaw(id.ToString(), project.ToString(), kValidProfile, "active", "shred");

  bool caught = false;
  try {
    (void)f.store->GetWarehouseById(id);
  } catch (const DatabaseIntegrityError&) {
    caught = true;
  }
  assert(caught);
}

void TestDanglingProjectIsIntegrityError() {
  Fixture    f;
  const auto orphan_project = ProjectId::Generate();
  const auto id             = WarehouseId::Generate();
  f.InsertRaw(id.ToString(), orphan_project.ToString(), kValidProfile, "active");

  bool get = false;
  try {
    (void)f.store->GetWarehouseById(id);
  } catch (const DatabaseIntegrityError& e) {
    get = true;
    assert(e.Message().find(orphan_project.ToString()) != std::string::npos);
  }
  assert(get);

  bool list = false;
  try {
    (void)f.service->ListWarehouses(orphan_project);
  } catch (const catalog::error::ListWarehousesError& e) {
    list = true;
    assert(e.Is<DatabaseIntegrityError>());
  }
  assert(list);
}

void TestMalformedIdIsIntegrityError() {
  Fixture    f;
  const auto project = f.AddProject();
  f.InsertRaw("not-a-uuid", project.ToString(), kValidProfile, "active");

  bool caught = false;
  try {
    (void)f.store->ListWarehouses(project, {WarehouseStatus::kActive});
  } catch (const DatabaseIntegrityError& e) {
    caught = true;
    assert(e.Message().find("not-a-uuid") != std::string::npos);
  }
  assert(caught);
}

void TestDataSurvivesReopen() {
  Fixture    f;
  const auto project = f.AddProject();
  const auto id      = f.Create("durable", project);

  f.service.reset();
  f.store = SqliteCatalogStore::Open(f.path, true);
  f.store->ApplySchema();
  f.service = std::make_unique<WarehouseService>(catalog::service::ServiceContext{f.store});

  assert(f.service->RequireWarehouse(id).name == "durable");
}

} // namespace

int main() {
  TestCreateGetAndUniqueName();
  TestCreateInMissingProject();
  TestUncommittedWritesAreInvisible();
  TestRollbackOnDestruction();
  TestDeleteGuards();
  TestUnknownStatusIsIntegrityError();
  TestUnparseableProfileIsIntegrityError();
  TestUnknownDeleteModeIsIntegrityError();
  TestDanglingProjectIsIntegrityError();
  TestMalformedIdIsIntegrityError();
  TestDataSurvivesReopen();

  std::cout << "catalog_manager_unit_sqlite_catalog_store: pass\n";
  return 0;
}
