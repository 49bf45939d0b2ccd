#include "memory_store.hpp"

#include <algorithm>

#include "internal/db/warehouse_codec.hpp"
#include "internal/error/backend_error.hpp"
#include "internal/error/warehouse_errors.hpp"
#include "memory_tx.hpp"

namespace catalog::db::memory {

namespace {

bool WantsStatus(const std::vector<model::WarehouseStatus>& statuses, model::WarehouseStatus status) {
  return std::find(statuses.begin(), statuses.end(), status) != statuses.end();
}

} // namespace

MemoryCatalogStore::MemoryCatalogStore() = default;

std::unique_ptr<db::Transaction> MemoryCatalogStore::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

void MemoryCatalogStore::CreateProject(Transaction& t, const model::ProjectId& project_id, const std::string& name) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = project_id.ToString();
  if (s.projects.contains(key)) {
    throw error::CatalogBackendError::Unexpected("project '" + key + "' already exists");
  }
  tx.TouchProject(key);
  s.projects[key] = name;
}

model::WarehouseId MemoryCatalogStore::CreateWarehouse(Transaction& t, const std::string& warehouse_name,
                                                       const model::ProjectId& project_id,
                                                       const catalog::v1::StorageProfile& storage_profile,
                                                       const catalog::v1::TabularDeleteProfile& tabular_delete_profile,
                                                       const std::optional<model::SecretIdent>& storage_secret_id) {
  auto&      tx      = TX(t);
  auto&      s       = tx.Mutable();
  const auto project = project_id.ToString();

  tx.TouchProject(project);
  if (!s.projects.contains(project)) {
    throw error::ProjectIdNotFoundError(project_id);
  }

  for (const auto& [_, row] : s.warehouses) {
    if (row.project_id == project && row.warehouse_name == warehouse_name) {
      throw error::WarehouseAlreadyExists(warehouse_name, project_id);
    }
  }

  const auto warehouse_id = model::WarehouseId::Generate();
  auto record = EncodeWarehouse(warehouse_id, warehouse_name, project_id, storage_profile, tabular_delete_profile,
                                storage_secret_id);

  tx.TouchWarehouse(record.warehouse_id);
  s.warehouses[record.warehouse_id] = std::move(record);
  return warehouse_id;
}

void MemoryCatalogStore::DeleteWarehouse(Transaction& t, const model::WarehouseId& warehouse_id,
                                         const catalog::v1::DeleteWarehouseQuery& query) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = warehouse_id.ToString();

  tx.TouchWarehouse(key);
  const auto it = s.warehouses.find(key);
  if (it == s.warehouses.end()) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }

  for (const auto& [task_id, owner] : s.tasks) {
    if (owner == key) {
      throw error::WarehouseHasUnfinishedTasks();
    }
  }

  if (it->second.is_protected && !query.force()) {
    throw error::WarehouseProtected();
  }

  const auto ns = s.namespaces.find(key);
  if (ns != s.namespaces.end() && !ns->second.empty() && !query.force()) {
    throw error::WarehouseNotEmpty();
  }

  s.warehouses.erase(it);
  s.namespaces.erase(key);
}

void MemoryCatalogStore::RenameWarehouse(Transaction& t, const model::WarehouseId& warehouse_id,
                                         const std::string& new_name) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = warehouse_id.ToString();

  tx.TouchWarehouse(key);
  const auto it = s.warehouses.find(key);
  if (it == s.warehouses.end() || it->second.status != model::ToString(model::WarehouseStatus::kActive)) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }

  for (const auto& [other_id, row] : s.warehouses) {
    if (other_id != key && row.project_id == it->second.project_id && row.warehouse_name == new_name) {
      throw error::CatalogBackendError::Unexpected("warehouse name '" + new_name + "' is already taken in project " +
                                                   row.project_id);
    }
  }

  it->second.warehouse_name = new_name;
  ++it->second.version;
}

void MemoryCatalogStore::SetWarehouseStatus(Transaction& t, const model::WarehouseId& warehouse_id,
                                            model::WarehouseStatus status) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = warehouse_id.ToString();

  tx.TouchWarehouse(key);
  const auto it = s.warehouses.find(key);
  if (it == s.warehouses.end()) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
  it->second.status = std::string(model::ToString(status));
  ++it->second.version;
}

void MemoryCatalogStore::SetWarehouseProtected(Transaction& t, const model::WarehouseId& warehouse_id,
                                               bool is_protected) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = warehouse_id.ToString();

  tx.TouchWarehouse(key);
  const auto it = s.warehouses.find(key);
  if (it == s.warehouses.end()) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
  it->second.is_protected = is_protected;
  ++it->second.version;
}

std::vector<model::GetWarehouseResponse> MemoryCatalogStore::ListWarehouses(
    const model::ProjectId& project_id, const std::vector<model::WarehouseStatus>& statuses) {
  std::vector<WarehouseRecord> rows;
  bool                         project_exists = false;
  const auto                   project        = project_id.ToString();
  {
    std::scoped_lock lock(mutex_);
    project_exists = committed_.projects.contains(project);
    for (const auto& [_, row] : committed_.warehouses) {
      if (row.project_id == project) rows.push_back(row);
    }
  }

  if (!project_exists && !rows.empty()) {
    throw error::DatabaseIntegrityError("Warehouse references missing project " + project);
  }

  std::vector<model::GetWarehouseResponse> out;
  for (const auto& row : rows) {
    auto warehouse = DecodeWarehouse(row);
    if (WantsStatus(statuses, warehouse.status)) {
      out.push_back(std::move(warehouse));
    }
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.name != b.name) return a.name < b.name;
    return a.id < b.id;
  });
  return out;
}

std::optional<model::GetWarehouseResponse> MemoryCatalogStore::GetWarehouseById(
    const model::WarehouseId& warehouse_id) {
  WarehouseRecord row;
  bool            project_exists = false;
  {
    std::scoped_lock lock(mutex_);
    const auto       it = committed_.warehouses.find(warehouse_id.ToString());
    if (it == committed_.warehouses.end()) return std::nullopt;
    row            = it->second;
    project_exists = committed_.projects.contains(row.project_id);
  }

  if (!project_exists) {
    throw error::DatabaseIntegrityError("Warehouse " + row.warehouse_id + " references missing project " +
                                        row.project_id);
  }
  return DecodeWarehouse(row);
}

void MemoryCatalogStore::AddNamespace(Transaction& t, const model::WarehouseId& warehouse_id,
                                      const std::string& namespace_name) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = warehouse_id.ToString();

  tx.TouchWarehouse(key);
  const auto it = s.warehouses.find(key);
  if (it == s.warehouses.end()) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
  s.namespaces[key].insert(namespace_name);
  ++it->second.version;
}

void MemoryCatalogStore::EnqueueTask(Transaction& t, const model::WarehouseId& warehouse_id,
                                     const std::string& task_id) {
  auto&      tx  = TX(t);
  auto&      s   = tx.Mutable();
  const auto key = warehouse_id.ToString();

  tx.TouchWarehouse(key);
  tx.TouchTask(task_id);
  const auto it = s.warehouses.find(key);
  if (it == s.warehouses.end()) {
    throw error::WarehouseIdNotFound(warehouse_id);
  }
  if (s.tasks.contains(task_id)) {
    throw error::CatalogBackendError::Unexpected("task '" + task_id + "' already exists");
  }
  s.tasks[task_id] = key;
  ++it->second.version;
}

void MemoryCatalogStore::FinishTask(Transaction& t, const std::string& task_id) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();

  tx.TouchTask(task_id);
  const auto task = s.tasks.find(task_id);
  if (task == s.tasks.end()) {
    throw error::CatalogBackendError::Unexpected("task '" + task_id + "' not found");
  }

  const auto warehouse = s.warehouses.find(task->second);
  if (warehouse != s.warehouses.end()) {
    tx.TouchWarehouse(task->second);
    ++warehouse->second.version;
  }
  s.tasks.erase(task);
}

} // namespace catalog::db::memory
