#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "catalog/management/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/error/error_model.hpp"
#include "internal/factory.hpp"
#include "internal/model/ids.hpp"
#include "internal/observability/logging.hpp"

using catalog::model::ProjectId;
using catalog::model::WarehouseId;
using catalog::model::WarehouseStatus;

static void Usage() {
  std::cout << "Usage:\n"
            << "  catalog-manager-admin --config <config.yaml> create-project <project-id> <name>\n"
            << "  catalog-manager-admin --config <config.yaml> create <project-id> <name> <storage-type>\n"
            << "  catalog-manager-admin --config <config.yaml> list <project-id> [--all]\n"
            << "  catalog-manager-admin --config <config.yaml> get <warehouse-id>\n"
            << "  catalog-manager-admin --config <config.yaml> rename <warehouse-id> <new-name>\n"
            << "  catalog-manager-admin --config <config.yaml> deactivate|activate <warehouse-id>\n"
            << "  catalog-manager-admin --config <config.yaml> protect|unprotect <warehouse-id>\n"
            << "  catalog-manager-admin --config <config.yaml> delete <warehouse-id> [--force]\n";
}

static void PrintWarehouse(const catalog::model::GetWarehouseResponse& warehouse) {
  std::cout << warehouse.id.ToString() << "\t" << warehouse.name << "\t" << catalog::model::ToString(warehouse.status)
            << "\t" << warehouse.storage_profile.storage_type() << (warehouse.is_protected ? "\tprotected" : "")
            << "\n";
}

// Each command gets its own transaction.
template <typename Fn>
static auto InTransaction(catalog::db::CatalogStore& store, Fn&& fn) {
  auto tx = store.Begin();
  return catalog::db::CommitAfter(*tx, std::forward<Fn>(fn));
}

static int Run(catalog::factory::RuntimeDependencies& deps, const std::vector<std::string>& args) {
  auto&       service = *deps.warehouse_service;
  auto&       store   = *deps.store;
  const auto& cmd     = args[0];

  if (cmd == "create-project" && args.size() == 3) {
    const auto project_id = ProjectId::FromString(args[1]);
    InTransaction(store, [&](auto& tx) { service.CreateProject(project_id, args[2], tx); });
    return 0;
  }

  if (cmd == "create" && args.size() == 4) {
    const auto project_id = ProjectId::FromString(args[1]);

    catalog::v1::StorageProfile profile;
    profile.set_storage_type(args[3]);
    catalog::v1::TabularDeleteProfile delete_profile;
    delete_profile.mutable_hard();

    const auto warehouse_id = InTransaction(store, [&](auto& tx) {
      return service.CreateWarehouse(args[2], project_id, profile, delete_profile, std::nullopt, tx);
    });
    std::cout << warehouse_id.ToString() << "\n";
    return 0;
  }

  if (cmd == "list" && (args.size() == 2 || (args.size() == 3 && args[2] == "--all"))) {
    std::optional<std::vector<WarehouseStatus>> statuses;
    if (args.size() == 3) {
      statuses = std::vector<WarehouseStatus>{WarehouseStatus::kActive, WarehouseStatus::kInactive};
    }
    for (const auto& warehouse : service.ListWarehouses(ProjectId::FromString(args[1]), statuses)) {
      PrintWarehouse(warehouse);
    }
    return 0;
  }

  if (cmd == "get" && args.size() == 2) {
    PrintWarehouse(service.RequireWarehouse(WarehouseId::FromString(args[1])));
    return 0;
  }

  if (cmd == "rename" && args.size() == 3) {
    const auto warehouse_id = WarehouseId::FromString(args[1]);
    InTransaction(store, [&](auto& tx) { service.RenameWarehouse(warehouse_id, args[2], tx); });
    return 0;
  }

  if ((cmd == "deactivate" || cmd == "activate") && args.size() == 2) {
    const auto warehouse_id = WarehouseId::FromString(args[1]);
    const auto status       = cmd == "activate" ? WarehouseStatus::kActive : WarehouseStatus::kInactive;
    InTransaction(store, [&](auto& tx) { service.SetWarehouseStatus(warehouse_id, status, tx); });
    return 0;
  }

  if ((cmd == "protect" || cmd == "unprotect") && args.size() == 2) {
    const auto warehouse_id = WarehouseId::FromString(args[1]);
    InTransaction(store, [&](auto& tx) { service.SetWarehouseProtected(warehouse_id, cmd == "protect", tx); });
    return 0;
  }

  if (cmd == "delete" && (args.size() == 2 || (args.size() == 3 && args[2] == "--force"))) {
    const auto warehouse_id = WarehouseId::FromString(args[1]);

    catalog::v1::DeleteWarehouseQuery query;
    query.set_force(args.size() == 3);
    InTransaction(store, [&](auto& tx) { service.DeleteWarehouse(warehouse_id, query, tx); });
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  catalog::factory::RuntimeDependencies deps;
  try {
    auto config = catalog::config::ConfigLoader::LoadFromYaml(config_path);
    catalog::observability::InitializeLogging(config);
    deps = catalog::factory::BuildRuntime(config);
  } catch (const std::exception& e) {
    std::cerr << "catalog-manager-admin: " << e.what() << "\n";
    return 2;
  }

  int rc = 1;
  try {
    rc = Run(deps, args);
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid argument: " << e.what() << "\n";
    Usage();
  } catch (const std::exception& e) {
    const auto response = catalog::error::ToIcebergErrorResponse(catalog::error::ToErrorModel(e));
    std::cerr << catalog::error::ToJson(response) << "\n";
  }

  catalog::observability::ShutdownLogging();
  return rc;
}
