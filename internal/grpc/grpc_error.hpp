#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

#include "catalog/management/v1.hpp"

namespace catalog::grpc {

/*
  Converts catalog errors into gRPC status codes.

  The serialized catalog::v1::ErrorModel travels in the status details so
  clients keep the type tag and context stack.
*/

::grpc::StatusCode ToStatusCode(const catalog::v1::ErrorModel& model);

::grpc::Status ToStatus(const catalog::v1::ErrorModel& model);

::grpc::Status ToStatus(const std::exception& e);

} // namespace catalog::grpc
