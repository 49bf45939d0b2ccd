#include "warehouse.hpp"

namespace catalog::model {

std::string_view ToString(WarehouseStatus status) {
  switch (status) {
    case WarehouseStatus::kActive:
      return "active";
    case WarehouseStatus::kInactive:
      return "inactive";
  }
  return "unknown";
}

std::optional<WarehouseStatus> ParseWarehouseStatus(std::string_view text) {
  if (text == "active") return WarehouseStatus::kActive;
  if (text == "inactive") return WarehouseStatus::kInactive;
  return std::nullopt;
}

} // namespace catalog::model
