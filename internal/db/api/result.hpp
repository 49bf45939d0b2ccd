#pragma once

#include <string>

namespace catalog::db {

/*
  Portable backend result codes.

  sqlite result codes and postgres SQLSTATEs are translated into these at
  the driver boundary; CatalogBackendError::FromResult classifies them.
  Nothing above internal/db sees pqxx or sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  AlreadyExists,        // unique key
  ForeignKeyViolation,  // dangling project / warehouse reference
  ConstraintViolation,  // any other integrity constraint

  Conflict,              // deadlock, write-write conflict
  Busy,                  // sqlite lock held by another connection
  SerializationFailure,  // postgres 40001

  IOError,
  Corruption,
  InternalError
};

const char* ToString(ErrorCode code);

// Lost a concurrency race; rerunning the whole transaction may succeed.
bool IsRetryable(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace catalog::db
