#pragma once

#include <memory>

namespace catalog::db { class CatalogStore; }

namespace catalog::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<catalog::db::CatalogStore> store;
};

}
