#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_store.hpp"

namespace catalog::db::memory {

/*
  Transaction = snapshot + touched rows

  Touch*() must be called before the first write to a row; it remembers the
  snapshot version the write is based on.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryCatalogStore& store);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryCatalogStore::State& Mutable();
  const MemoryCatalogStore::State& View() const {
    return working_;
  }

  void TouchWarehouse(const std::string& warehouse_id);
  void TouchProject(const std::string& project_id);
  void TouchTask(const std::string& task_id);

 private:
  void Validate(const MemoryCatalogStore::State& committed) const;
  void Apply(MemoryCatalogStore::State& committed);

  MemoryCatalogStore&       store_;
  MemoryCatalogStore::State working_;

  std::map<std::string, std::optional<uint64_t>> warehouse_versions_;
  std::map<std::string, bool>                    project_existed_;
  std::map<std::string, bool>                    task_existed_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace catalog::db::memory
