#include "backend_error.hpp"

#include <sstream>

namespace catalog::error {

namespace {

void WriteStack(std::ostringstream& out, const std::vector<std::string>& stack) {
  if (stack.empty()) {
    return;
  }
  out << "Stack:\n";
  for (const auto& detail : stack) {
    out << "  " << detail << "\n";
  }
}

} // namespace

std::string_view ToString(BackendErrorType type) {
  switch (type) {
    case BackendErrorType::kUnexpected:
      return "Unexpected";
    case BackendErrorType::kConcurrentModification:
      return "ConcurrentModification";
  }
  return "Unexpected";
}

CatalogBackendError::CatalogBackendError(ErrorCause source, BackendErrorType type)
    : std::runtime_error("Catalog backend error (" + std::string(ToString(type)) + "): " + source.Message()),
      type_(type),
      source_(std::move(source)) {
}

CatalogBackendError CatalogBackendError::Classify(const std::exception& source, BackendErrorType type) {
  return CatalogBackendError(ErrorCause::FromException(source), type);
}

CatalogBackendError CatalogBackendError::Unexpected(const std::exception& source) {
  return Classify(source, BackendErrorType::kUnexpected);
}

CatalogBackendError CatalogBackendError::Unexpected(std::string message) {
  return CatalogBackendError(ErrorCause(std::move(message)), BackendErrorType::kUnexpected);
}

CatalogBackendError CatalogBackendError::ConcurrentModification(std::string message) {
  return CatalogBackendError(ErrorCause(std::move(message)), BackendErrorType::kConcurrentModification);
}

CatalogBackendError CatalogBackendError::FromResult(const db::Result& result) {
  auto message = std::string(db::ToString(result.code));
  if (!result.message.empty()) {
    message += ": " + result.message;
  }

  if (db::IsRetryable(result.code)) {
    return ConcurrentModification(std::move(message));
  }
  return Unexpected(std::move(message));
}

std::string CatalogBackendError::Describe() const {
  std::ostringstream out;
  out << "CatalogBackendError (" << ToString(type_) << "): " << source_.Message() << "\n";
  WriteStack(out, Stack());

  if (const auto* cause = source_.Source()) {
    out << "Caused by:\n";
    out << cause->Message() << "\n\n";
    for (cause = cause->Source(); cause != nullptr; cause = cause->Source()) {
      out << "Caused by:\n\t" << cause->Message() << "\n";
    }
  }
  return out.str();
}

bool operator==(const CatalogBackendError& lhs, const CatalogBackendError& rhs) {
  return lhs.type_ == rhs.type_ && lhs.Stack() == rhs.Stack() && lhs.source_.Render() == rhs.source_.Render();
}

DatabaseIntegrityError::DatabaseIntegrityError(std::string message)
    : std::runtime_error(message), message_(std::move(message)) {
}

std::string DatabaseIntegrityError::Describe() const {
  std::ostringstream out;
  out << "DatabaseIntegrityError: " << message_ << "\n";
  WriteStack(out, Stack());
  return out.str();
}

bool operator==(const DatabaseIntegrityError& lhs, const DatabaseIntegrityError& rhs) {
  return lhs.message_ == rhs.message_ && lhs.Stack() == rhs.Stack();
}

} // namespace catalog::error
