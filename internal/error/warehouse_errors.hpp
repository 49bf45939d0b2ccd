#pragma once

#include <stdexcept>
#include <string>

#include "internal/error/error_cause.hpp"
#include "internal/error/error_stack.hpp"
#include "internal/model/ids.hpp"

namespace catalog::error {

/*
  Warehouse invariant violations.

  One type per violated invariant, carrying only what the message needs.
  what() is the user facing message; context lives in Stack().
*/

class WarehouseIdNotFound : public std::runtime_error, public ErrorStack<WarehouseIdNotFound> {
 public:
  explicit WarehouseIdNotFound(model::WarehouseId warehouse_id);

  const model::WarehouseId& Id() const {
    return warehouse_id_;
  }

 private:
  model::WarehouseId warehouse_id_;
};

class WarehouseAlreadyExists : public std::runtime_error, public ErrorStack<WarehouseAlreadyExists> {
 public:
  WarehouseAlreadyExists(std::string warehouse_name, model::ProjectId project_id);

  const std::string& Name() const {
    return warehouse_name_;
  }

  const model::ProjectId& Project() const {
    return project_id_;
  }

 private:
  std::string      warehouse_name_;
  model::ProjectId project_id_;
};

// Only raised by create.
class ProjectIdNotFoundError : public std::runtime_error, public ErrorStack<ProjectIdNotFoundError> {
 public:
  explicit ProjectIdNotFoundError(model::ProjectId project_id);

  const model::ProjectId& Project() const {
    return project_id_;
  }

 private:
  model::ProjectId project_id_;
};

// The storage profile could not be encoded for persistence. The cause is
// attached to the wire error.
class StorageProfileSerializationError : public std::runtime_error,
                                         public ErrorStack<StorageProfileSerializationError> {
 public:
  explicit StorageProfileSerializationError(ErrorCause source);

  const ErrorCause& Source() const {
    return source_;
  }

 private:
  ErrorCause source_;
};

// Delete guards.

class WarehouseHasUnfinishedTasks : public std::runtime_error, public ErrorStack<WarehouseHasUnfinishedTasks> {
 public:
  WarehouseHasUnfinishedTasks();
};

class WarehouseNotEmpty : public std::runtime_error, public ErrorStack<WarehouseNotEmpty> {
 public:
  WarehouseNotEmpty();
};

class WarehouseProtected : public std::runtime_error, public ErrorStack<WarehouseProtected> {
 public:
  WarehouseProtected();
};

} // namespace catalog::error
