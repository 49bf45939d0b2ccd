#pragma once

#include <cstdint>
#include <string>

namespace catalog::db {

/*
  Persistent warehouse row.

  IMPORTANT:
  - Text columns are exactly what the backend stores; decoding them is
    where integrity violations are detected.
  - Version increments on every write to the row (and on writes that the
    delete guards depend on) and drives optimistic concurrency.
*/

struct WarehouseRecord {
  std::string warehouse_id;
  std::string warehouse_name;
  std::string project_id;

  std::string storage_profile;    // JSON
  std::string storage_secret_id;  // empty = none

  std::string status = "active";

  std::string tabular_delete_mode = "hard";  // hard | soft
  int64_t     tabular_expiration_seconds = 0;

  bool is_protected = false;

  uint64_t version = 1;
};

} // namespace catalog::db
