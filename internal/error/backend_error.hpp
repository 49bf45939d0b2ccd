#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/error/error_cause.hpp"
#include "internal/error/error_stack.hpp"

namespace catalog::error {

enum class BackendErrorType {
  // Anything that is not a recognised conflict.
  kUnexpected,
  // A write lost an optimistic concurrency race; the caller may retry the
  // whole operation including its reads.
  kConcurrentModification,
};

std::string_view ToString(BackendErrorType type);

/*
  CatalogBackendError

  Infrastructure failure of the storage backend: classification, context
  stack and the underlying cause. The cause is for operators only and never
  reaches the wire.
*/
class CatalogBackendError : public std::runtime_error, public ErrorStack<CatalogBackendError> {
 public:
  CatalogBackendError(ErrorCause source, BackendErrorType type);

  static CatalogBackendError Classify(const std::exception& source, BackendErrorType type);
  static CatalogBackendError Unexpected(const std::exception& source);
  static CatalogBackendError Unexpected(std::string message);
  static CatalogBackendError ConcurrentModification(std::string message);

  // Conflict, Busy and SerializationFailure are retryable races, the rest unexpected.
  static CatalogBackendError FromResult(const db::Result& result);

  BackendErrorType Type() const {
    return type_;
  }

  const ErrorCause& Source() const {
    return source_;
  }

  // Multi-line operator rendering: classification, stack, cause chain.
  std::string Describe() const;

  // Compares the rendered cause, not its identity.
  friend bool operator==(const CatalogBackendError& lhs, const CatalogBackendError& rhs);

 private:
  BackendErrorType type_;
  ErrorCause       source_;
};

/*
  Persisted state violates an invariant the catalog relies on (dangling
  reference, unparseable stored value). Signals bad data, not a transient
  backend failure.
*/
class DatabaseIntegrityError : public std::runtime_error, public ErrorStack<DatabaseIntegrityError> {
 public:
  explicit DatabaseIntegrityError(std::string message);

  const std::string& Message() const {
    return message_;
  }

  std::string Describe() const;

  friend bool operator==(const DatabaseIntegrityError& lhs, const DatabaseIntegrityError& rhs);

 private:
  std::string message_;
};

} // namespace catalog::error
