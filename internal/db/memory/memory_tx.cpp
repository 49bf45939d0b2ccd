#include "memory_tx.hpp"

#include "internal/error/backend_error.hpp"

namespace catalog::db::memory {

namespace {

error::CatalogBackendError Conflict(const std::string& what) {
  return error::CatalogBackendError::ConcurrentModification("transaction conflict: " + what +
                                                            " was modified by a concurrent transaction");
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryCatalogStore& store) : store_(store) {
  std::scoped_lock lock(store_.mutex_);
  working_ = store_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryCatalogStore::State& MemoryTransaction::Mutable() {
  if (committed_ || rolled_back_) {
    throw error::CatalogBackendError::Unexpected("transaction already finished");
  }
  return working_;
}

void MemoryTransaction::TouchWarehouse(const std::string& warehouse_id) {
  if (warehouse_versions_.contains(warehouse_id)) return;

  const auto it = working_.warehouses.find(warehouse_id);
  warehouse_versions_.emplace(warehouse_id, it == working_.warehouses.end() ? std::nullopt
                                                                            : std::optional<uint64_t>(it->second.version));
}

void MemoryTransaction::TouchProject(const std::string& project_id) {
  project_existed_.try_emplace(project_id, working_.projects.contains(project_id));
}

void MemoryTransaction::TouchTask(const std::string& task_id) {
  task_existed_.try_emplace(task_id, working_.tasks.contains(task_id));
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw error::CatalogBackendError::Unexpected("transaction already finished");
  }

  std::scoped_lock lock(store_.mutex_);
  Validate(store_.committed_);
  Apply(store_.committed_);
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  working_     = {};
}

void MemoryTransaction::Validate(const MemoryCatalogStore::State& committed) const {
  for (const auto& [id, seen] : warehouse_versions_) {
    const auto               it = committed.warehouses.find(id);
    const std::optional<uint64_t> current =
        it == committed.warehouses.end() ? std::nullopt : std::optional<uint64_t>(it->second.version);
    if (current != seen) {
      throw Conflict("warehouse '" + id + "'");
    }
  }

  for (const auto& [id, existed] : project_existed_) {
    if (committed.projects.contains(id) != existed) {
      throw Conflict("project '" + id + "'");
    }
  }

  for (const auto& [id, existed] : task_existed_) {
    if (committed.tasks.contains(id) != existed) {
      throw Conflict("task '" + id + "'");
    }
  }

  // Names are unique per project; a concurrent writer may have claimed one
  // this transaction also claims.
  for (const auto& [id, _] : warehouse_versions_) {
    const auto mine = working_.warehouses.find(id);
    if (mine == working_.warehouses.end()) continue;

    for (const auto& [other_id, other] : committed.warehouses) {
      if (other_id == id || warehouse_versions_.contains(other_id)) continue;
      if (other.project_id == mine->second.project_id && other.warehouse_name == mine->second.warehouse_name) {
        throw Conflict("warehouse name '" + mine->second.warehouse_name + "'");
      }
    }
  }
}

void MemoryTransaction::Apply(MemoryCatalogStore::State& committed) {
  for (const auto& [id, _] : warehouse_versions_) {
    const auto row = working_.warehouses.find(id);
    if (row == working_.warehouses.end()) {
      committed.warehouses.erase(id);
      committed.namespaces.erase(id);
      continue;
    }
    committed.warehouses[id] = row->second;

    const auto ns = working_.namespaces.find(id);
    if (ns == working_.namespaces.end()) {
      committed.namespaces.erase(id);
    } else {
      committed.namespaces[id] = ns->second;
    }
  }

  for (const auto& [id, _] : project_existed_) {
    const auto project = working_.projects.find(id);
    if (project != working_.projects.end()) {
      committed.projects[id] = project->second;
    }
  }

  for (const auto& [id, _] : task_existed_) {
    const auto task = working_.tasks.find(id);
    if (task == working_.tasks.end()) {
      committed.tasks.erase(id);
    } else {
      committed.tasks[id] = task->second;
    }
  }
}

} // namespace catalog::db::memory
