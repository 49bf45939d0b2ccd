#include "error_cause.hpp"

#include <sstream>

namespace catalog::error {

ErrorCause::ErrorCause(std::string message, std::shared_ptr<const ErrorCause> source)
    : message_(std::move(message)), source_(std::move(source)) {
}

ErrorCause ErrorCause::FromException(const std::exception& e) {
  std::shared_ptr<const ErrorCause> source;
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    source = std::make_shared<ErrorCause>(FromException(nested));
  } catch (...) {
    source = std::make_shared<ErrorCause>("unknown non-standard exception");
  }
  return ErrorCause(e.what(), std::move(source));
}

std::string ErrorCause::Render() const {
  std::ostringstream out;
  out << message_;
  for (const ErrorCause* cause = Source(); cause != nullptr; cause = cause->Source()) {
    out << "\nCaused by: " << cause->Message();
  }
  return out.str();
}

} // namespace catalog::error
