#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/catalog_store.hpp"
#include "internal/service/warehouse_service.hpp"

namespace catalog::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::CatalogStore> store;

  std::shared_ptr<service::WarehouseService> warehouse_service;
};

/*
  BuildStore

  Opens the configured backend and makes sure its schema exists.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::CatalogStore> BuildStore(const catalog::runtime::config::RuntimeConfig& config);

RuntimeDependencies BuildRuntime(const catalog::runtime::config::RuntimeConfig& config);

}
