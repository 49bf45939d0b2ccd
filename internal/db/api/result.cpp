#include "result.hpp"

namespace catalog::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::AlreadyExists: return "already exists";
    case ErrorCode::ForeignKeyViolation: return "foreign key violation";
    case ErrorCode::ConstraintViolation: return "constraint violation";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::SerializationFailure: return "serialization failure";
    case ErrorCode::IOError: return "io error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal error";
  }
  return "unknown";
}

bool IsRetryable(ErrorCode code) {
  return code == ErrorCode::Conflict || code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
}

} // namespace catalog::db
