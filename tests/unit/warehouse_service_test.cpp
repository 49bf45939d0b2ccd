#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_store.hpp"
#include "internal/error/error_model.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/warehouse_service.hpp"

namespace {

using catalog::db::memory::MemoryCatalogStore;
using catalog::error::BackendErrorType;
using catalog::error::CatalogBackendError;
using catalog::model::ProjectId;
using catalog::model::WarehouseId;
using catalog::model::WarehouseStatus;
using catalog::service::WarehouseService;

struct Fixture {
  std::shared_ptr<MemoryCatalogStore> store = std::make_shared<MemoryCatalogStore>();
  WarehouseService                    service{catalog::service::ServiceContext{store}};
  ProjectId                           project = ProjectId::Generate();

  Fixture() {
    AddProject(project);
  }

  void AddProject(const ProjectId& project_id) {
    auto tx = store->Begin();
    service.CreateProject(project_id, "project-" + project_id.ToString(), *tx);
    tx->Commit();
  }

  WarehouseId Create(const std::string& name, const ProjectId& project_id) {
    catalog::v1::StorageProfile profile;
    profile.set_storage_type("s3");
    (*profile.mutable_config()->mutable_fields())["bucket"].set_string_value("bucket-" + name);

    catalog::v1::TabularDeleteProfile delete_profile;
    delete_profile.mutable_soft()->set_expiration_seconds(3600);

    auto tx = store->Begin();
    auto id = service.CreateWarehouse(name, project_id, profile, delete_profile, std::nullopt, *tx);
    tx->Commit();
    return id;
  }

  WarehouseId Create(const std::string& name) {
    return Create(name, project);
  }

  void SetStatus(const WarehouseId& id, WarehouseStatus status) {
    auto tx = store->Begin();
    service.SetWarehouseStatus(id, status, *tx);
    tx->Commit();
  }

  void Delete(const WarehouseId& id, bool force) {
    catalog::v1::DeleteWarehouseQuery query;
    query.set_force(force);
    auto tx = store->Begin();
    service.DeleteWarehouse(id, query, *tx);
    tx->Commit();
  }
};

void TestCreateThenRequire() {
  Fixture f;
  const auto id = f.Create("sales");

  const auto warehouse = f.service.RequireWarehouse(id);
  assert(warehouse.id == id);
  assert(warehouse.name == "sales");
  assert(warehouse.project_id == f.project);
  assert(warehouse.status == WarehouseStatus::kActive);
  assert(!warehouse.is_protected);
  assert(!warehouse.storage_secret_id);
  assert(warehouse.storage_profile.storage_type() == "s3");
  assert(warehouse.storage_profile.config().fields().at("bucket").string_value() == "bucket-sales");
  assert(warehouse.tabular_delete_profile.has_soft());
  assert(warehouse.tabular_delete_profile.soft().expiration_seconds() == 3600);

  const auto got = f.service.GetWarehouse(id);
  assert(got);
  assert(got->id == warehouse.id);
  assert(got->name == warehouse.name);
}

void TestDuplicateNameInSameProject() {
  Fixture f;
  f.Create("sales");

  bool caught = false;
  try {
    f.Create("sales");
  } catch (const catalog::error::CreateWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseAlreadyExists>());
    assert(e.As<catalog::error::WarehouseAlreadyExists>().Name() == "sales");
    assert(e.As<catalog::error::WarehouseAlreadyExists>().Project() == f.project);
    assert(e.Stack().back() == "Error creating warehouse in catalog");
  }
  assert(caught);

  const auto other = ProjectId::Generate();
  f.AddProject(other);
  const auto id = f.Create("sales", other);
  assert(f.service.RequireWarehouse(id).project_id == other);
}

void TestCreateInMissingProject() {
  Fixture f;
  const auto missing = ProjectId::Generate();

  bool caught = false;
  try {
    f.Create("sales", missing);
  } catch (const catalog::error::CreateWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::ProjectIdNotFoundError>());
    assert(e.As<catalog::error::ProjectIdNotFoundError>().Project() == missing);
  }
  assert(caught);
}

void ExpectSerializationFailure(Fixture& f, const catalog::v1::StorageProfile& profile, const std::string& field) {
  catalog::v1::TabularDeleteProfile delete_profile;
  delete_profile.mutable_hard();

  bool caught = false;
  auto tx     = f.store->Begin();
  try {
    f.service.CreateWarehouse("unencodable", f.project, profile, delete_profile, std::nullopt, *tx);
  } catch (const catalog::error::CreateWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::StorageProfileSerializationError>());
    assert(e.As<catalog::error::StorageProfileSerializationError>().Source().Message().find(field) !=
           std::string::npos);

    const auto model = catalog::error::ToErrorModel(e);
    assert(model.type() == "StorageProfileSerializationError");
    assert(model.code() == 500);
    assert(model.has_source());
    assert(model.source().message().find(field) != std::string::npos);
  }
  assert(caught);
  tx->Rollback();
  assert(f.service.ListWarehouses(f.project).empty());
}

void TestInvalidUtf8ProfileIsRejected() {
  Fixture f;

  catalog::v1::StorageProfile value;
  value.set_storage_type("s3");
  (*value.mutable_config()->mutable_fields())["bucket"].set_string_value("\xff\xfe");
  ExpectSerializationFailure(f, value, "config.bucket");

  catalog::v1::StorageProfile nested;
  nested.set_storage_type("s3");
  auto* list = (*nested.mutable_config()->mutable_fields())["endpoints"].mutable_list_value();
  list->add_values()->set_string_value("https://a.example");
  list->add_values()->set_string_value("\xc3");
  ExpectSerializationFailure(f, nested, "config.endpoints[1]");

  catalog::v1::StorageProfile type;
  type.set_storage_type("s\x80");
  ExpectSerializationFailure(f, type, "storage_type");
}

void TestNonFiniteNumberProfileIsRejected() {
  Fixture f;

  catalog::v1::StorageProfile nan;
  nan.set_storage_type("s3");
  (*nan.mutable_config()->mutable_fields())["ratio"].set_number_value(std::numeric_limits<double>::quiet_NaN());
  ExpectSerializationFailure(f, nan, "config.ratio");

  catalog::v1::StorageProfile inf;
  inf.set_storage_type("s3");
  auto* inner = (*inf.mutable_config()->mutable_fields())["limits"].mutable_struct_value();
  (*inner->mutable_fields())["max"].set_number_value(std::numeric_limits<double>::infinity());
  ExpectSerializationFailure(f, inf, "config.limits.max");
}

void TestRequireMissingWarehouse() {
  Fixture f;
  const auto missing = WarehouseId::Generate();

  assert(!f.service.GetWarehouse(missing));

  bool caught = false;
  try {
    (void)f.service.RequireWarehouse(missing);
  } catch (const catalog::error::GetWarehouseByIdError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseIdNotFound>());
    assert(e.As<catalog::error::WarehouseIdNotFound>().Id() == missing);
  }
  assert(caught);
}

void TestListFiltersByStatus() {
  Fixture f;
  const auto b = f.Create("b-warehouse");
  const auto a = f.Create("a-warehouse");
  const auto c = f.Create("c-warehouse");
  f.SetStatus(b, WarehouseStatus::kInactive);

  const auto active = f.service.ListWarehouses(f.project);
  assert(active.size() == 2);
  assert(active[0].id == a);
  assert(active[1].id == c);
  for (const auto& warehouse : active) {
    assert(warehouse.status == WarehouseStatus::kActive);
  }

  const auto inactive = f.service.ListWarehouses(f.project, std::vector<WarehouseStatus>{WarehouseStatus::kInactive});
  assert(inactive.size() == 1);
  assert(inactive[0].id == b);

  const auto all = f.service.ListWarehouses(
      f.project, std::vector<WarehouseStatus>{WarehouseStatus::kActive, WarehouseStatus::kInactive});
  assert(all.size() == 3);
  assert(all[0].name == "a-warehouse");
  assert(all[1].name == "b-warehouse");
  assert(all[2].name == "c-warehouse");

  assert(f.service.ListWarehouses(f.project, std::vector<WarehouseStatus>{}).empty());
  assert(f.service.ListWarehouses(ProjectId::Generate()).empty());
}

void TestInactiveWarehouseIsHiddenFromGet() {
  Fixture f;
  const auto id = f.Create("sales");
  f.SetStatus(id, WarehouseStatus::kInactive);

  assert(!f.service.GetWarehouse(id));

  bool caught = false;
  try {
    (void)f.service.GetStorageConfig(id);
  } catch (const catalog::error::GetStorageConfigError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseIdNotFound>());
  }
  assert(caught);

  f.SetStatus(id, WarehouseStatus::kActive);
  const auto config = f.service.GetStorageConfig(id);
  assert(config.storage_profile.storage_type() == "s3");
  assert(!config.storage_secret_ident);
}

void TestDeleteWithUnfinishedTasksKeepsWarehouse() {
  Fixture f;
  const auto id = f.Create("sales");
  {
    auto tx = f.store->Begin();
    f.store->EnqueueTask(*tx, id, "compaction-1");
    tx->Commit();
  }

  catalog::v1::DeleteWarehouseQuery query;
  query.set_force(true);

  auto tx     = f.store->Begin();
  bool caught = false;
  try {
    f.service.DeleteWarehouse(id, query, *tx);
  } catch (const catalog::error::DeleteWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseHasUnfinishedTasks>());
    assert(e.Stack() == std::vector<std::string>{"Error deleting warehouse in catalog"});
  }
  assert(caught);
  assert(!tx->IsCommitted());
  tx->Rollback();

  assert(f.service.GetWarehouse(id));

  {
    auto finish = f.store->Begin();
    f.store->FinishTask(*finish, "compaction-1");
    finish->Commit();
  }
  f.Delete(id, false);
  assert(!f.service.GetWarehouse(id));
}

void TestDeleteProtectedRequiresForce() {
  Fixture f;
  const auto id = f.Create("sales");
  {
    auto tx = f.store->Begin();
    f.service.SetWarehouseProtected(id, true, *tx);
    tx->Commit();
  }
  assert(f.service.RequireWarehouse(id).is_protected);

  bool caught = false;
  try {
    f.Delete(id, false);
  } catch (const catalog::error::DeleteWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseProtected>());
  }
  assert(caught);
  assert(f.service.GetWarehouse(id));

  f.Delete(id, true);
  assert(!f.service.GetWarehouse(id));
}

void TestDeleteNonEmptyRequiresForce() {
  Fixture f;
  const auto id = f.Create("sales");
  {
    auto tx = f.store->Begin();
    f.store->AddNamespace(*tx, id, "finance");
    tx->Commit();
  }

  bool caught = false;
  try {
    f.Delete(id, false);
  } catch (const catalog::error::DeleteWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseNotEmpty>());
  }
  assert(caught);

  f.Delete(id, true);
  assert(!f.service.GetWarehouse(id));
}

void TestProtectedIsCheckedBeforeNotEmpty() {
  Fixture f;
  const auto id = f.Create("sales");
  {
    auto tx = f.store->Begin();
    f.store->AddNamespace(*tx, id, "finance");
    f.service.SetWarehouseProtected(id, true, *tx);
    tx->Commit();
  }

  bool caught = false;
  try {
    f.Delete(id, false);
  } catch (const catalog::error::DeleteWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseProtected>());
  }
  assert(caught);
}

void TestDeleteMissingWarehouse() {
  Fixture f;
  const auto missing = WarehouseId::Generate();

  bool caught = false;
  try {
    f.Delete(missing, true);
  } catch (const catalog::error::DeleteWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseIdNotFound>());
    assert(e.As<catalog::error::WarehouseIdNotFound>().Id() == missing);
  }
  assert(caught);
}

void TestRename() {
  Fixture f;
  const auto id    = f.Create("sales");
  const auto other = f.Create("marketing");

  {
    auto tx = f.store->Begin();
    f.service.RenameWarehouse(id, "revenue", *tx);
    tx->Commit();
  }
  assert(f.service.RequireWarehouse(id).name == "revenue");

  bool collided = false;
  try {
    auto tx = f.store->Begin();
    f.service.RenameWarehouse(id, "marketing", *tx);
  } catch (const catalog::error::RenameWarehouseError& e) {
    collided = true;
    assert(e.Is<CatalogBackendError>());
    assert(e.As<CatalogBackendError>().Type() == BackendErrorType::kUnexpected);
  }
  assert(collided);
  assert(f.service.RequireWarehouse(other).name == "marketing");

  f.SetStatus(id, WarehouseStatus::kInactive);
  bool hidden = false;
  try {
    auto tx = f.store->Begin();
    f.service.RenameWarehouse(id, "archive", *tx);
  } catch (const catalog::error::RenameWarehouseError& e) {
    hidden = true;
    assert(e.Is<catalog::error::WarehouseIdNotFound>());
  }
  assert(hidden);
}

void TestSetStatusOnMissingWarehouse() {
  Fixture f;

  bool caught = false;
  try {
    auto tx = f.store->Begin();
    f.service.SetWarehouseStatus(WarehouseId::Generate(), WarehouseStatus::kInactive, *tx);
  } catch (const catalog::error::SetWarehouseStatusError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseIdNotFound>());
    assert(e.Stack().back() == "Error setting warehouse status in catalog");
  }
  assert(caught);
}

void TestReadsSeeCommittedStateOnly() {
  Fixture f;

  catalog::v1::StorageProfile       profile;
  catalog::v1::TabularDeleteProfile delete_profile;

  auto       tx = f.store->Begin();
  const auto id = f.service.CreateWarehouse("pending", f.project, profile, delete_profile, std::nullopt, *tx);
  assert(!f.service.GetWarehouse(id));
  assert(f.service.ListWarehouses(f.project).empty());

  tx->Rollback();
  assert(!f.service.GetWarehouse(id));

  auto committed = f.store->Begin();
  const auto kept = f.service.CreateWarehouse("kept", f.project, profile, delete_profile, std::nullopt, *committed);
  committed->Commit();
  assert(committed->IsCommitted());

  const auto warehouse = f.service.RequireWarehouse(kept);
  assert(warehouse.tabular_delete_profile.has_hard());
}

void TestConcurrentRenameConflicts() {
  Fixture f;
  const auto id = f.Create("sales");

  auto first  = f.store->Begin();
  auto second = f.store->Begin();
  f.service.RenameWarehouse(id, "first", *first);
  f.service.RenameWarehouse(id, "second", *second);

  first->Commit();

  bool conflicted = false;
  try {
    second->Commit();
  } catch (const CatalogBackendError& e) {
    conflicted = true;
    assert(e.Type() == BackendErrorType::kConcurrentModification);
  }
  assert(conflicted);
  assert(!second->IsCommitted());
  assert(f.service.RequireWarehouse(id).name == "first");
}

void TestConcurrentCreateOfSameNameConflicts() {
  Fixture f;

  catalog::v1::StorageProfile       profile;
  catalog::v1::TabularDeleteProfile delete_profile;

  auto first  = f.store->Begin();
  auto second = f.store->Begin();
  f.service.CreateWarehouse("sales", f.project, profile, delete_profile, std::nullopt, *first);
  f.service.CreateWarehouse("sales", f.project, profile, delete_profile, std::nullopt, *second);

  first->Commit();

  bool conflicted = false;
  try {
    second->Commit();
  } catch (const CatalogBackendError& e) {
    conflicted = true;
    assert(e.Type() == BackendErrorType::kConcurrentModification);
  }
  assert(conflicted);
  assert(f.service.ListWarehouses(f.project).size() == 1);
}

void TestDisjointTransactionsBothCommit() {
  Fixture f;
  const auto a = f.Create("a");
  const auto b = f.Create("b");

  auto first  = f.store->Begin();
  auto second = f.store->Begin();
  f.service.RenameWarehouse(a, "a2", *first);
  f.service.RenameWarehouse(b, "b2", *second);
  first->Commit();
  second->Commit();

  assert(f.service.RequireWarehouse(a).name == "a2");
  assert(f.service.RequireWarehouse(b).name == "b2");
}

void TestTaskEnqueuedDuringDeleteConflicts() {
  Fixture f;
  const auto id = f.Create("sales");

  catalog::v1::DeleteWarehouseQuery query;
  auto                              deleting = f.store->Begin();
  f.service.DeleteWarehouse(id, query, *deleting);

  {
    auto tx = f.store->Begin();
    f.store->EnqueueTask(*tx, id, "purge-1");
    tx->Commit();
  }

  bool conflicted = false;
  try {
    deleting->Commit();
  } catch (const CatalogBackendError& e) {
    conflicted = true;
    assert(e.Type() == BackendErrorType::kConcurrentModification);
  }
  assert(conflicted);
  assert(f.service.GetWarehouse(id));
}

} // namespace

void TestCommitAfter() {
  Fixture f;

  auto       tx = f.store->Begin();
  const auto id = catalog::db::CommitAfter(*tx, [&](catalog::db::Transaction& t) {
    return f.service.CreateWarehouse("committed", f.project, {}, {}, std::nullopt, t);
  });
  assert(tx->IsCommitted());
  assert(f.service.GetWarehouse(id));

  auto failing = f.store->Begin();
  bool caught  = false;
  try {
    catalog::db::CommitAfter(*failing, [&](catalog::db::Transaction& t) {
      f.service.RenameWarehouse(id, "renamed", t);
      f.service.RenameWarehouse(WarehouseId::Generate(), "other", t);
    });
  } catch (const catalog::error::RenameWarehouseError& e) {
    caught = true;
    assert(e.Is<catalog::error::WarehouseIdNotFound>());
  }
  assert(caught);
  assert(!failing->IsCommitted());
  failing->Rollback();
  assert(f.service.RequireWarehouse(id).name == "committed");
}

int main() {
  TestCreateThenRequire();
  TestDuplicateNameInSameProject();
  TestCreateInMissingProject();
  TestInvalidUtf8ProfileIsRejected();
  TestNonFiniteNumberProfileIsRejected();
  TestRequireMissingWarehouse();
  TestListFiltersByStatus();
  TestInactiveWarehouseIsHiddenFromGet();
  TestDeleteWithUnfinishedTasksKeepsWarehouse();
  TestDeleteProtectedRequiresForce();
  TestDeleteNonEmptyRequiresForce();
  TestProtectedIsCheckedBeforeNotEmpty();
  TestDeleteMissingWarehouse();
  TestRename();
  TestSetStatusOnMissingWarehouse();
  TestReadsSeeCommittedStateOnly();
  TestConcurrentRenameConflicts();
  TestConcurrentCreateOfSameNameConflicts();
  TestDisjointTransactionsBothCommit();
  TestTaskEnqueuedDuringDeleteConflicts();
  TestCommitAfter();

  std::cout << "catalog_manager_unit_warehouse_service: pass\n";
  return 0;
}
