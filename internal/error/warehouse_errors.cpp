#include "warehouse_errors.hpp"

namespace catalog::error {

WarehouseIdNotFound::WarehouseIdNotFound(model::WarehouseId warehouse_id)
    : std::runtime_error("A warehouse with id '" + warehouse_id.ToString() + "' does not exist"),
      warehouse_id_(warehouse_id) {
}

WarehouseAlreadyExists::WarehouseAlreadyExists(std::string warehouse_name, model::ProjectId project_id)
    : std::runtime_error("A warehouse with the name '" + warehouse_name + "' already exists in project with id '" +
                         project_id.ToString() + "'"),
      warehouse_name_(std::move(warehouse_name)),
      project_id_(project_id) {
}

ProjectIdNotFoundError::ProjectIdNotFoundError(model::ProjectId project_id)
    : std::runtime_error("Project with id '" + project_id.ToString() + "' not found"), project_id_(project_id) {
}

StorageProfileSerializationError::StorageProfileSerializationError(ErrorCause source)
    : std::runtime_error("Error serializing storage profile: " + source.Message()), source_(std::move(source)) {
}

WarehouseHasUnfinishedTasks::WarehouseHasUnfinishedTasks()
    : std::runtime_error("Warehouse has unfinished tasks. Cannot delete warehouse until all tasks are finished.") {
}

WarehouseNotEmpty::WarehouseNotEmpty()
    : std::runtime_error("Warehouse is not empty. Cannot delete a non-empty warehouse.") {
}

WarehouseProtected::WarehouseProtected()
    : std::runtime_error("Warehouse is protected and force flag not set. Cannot delete protected warehouse.") {
}

} // namespace catalog::error
