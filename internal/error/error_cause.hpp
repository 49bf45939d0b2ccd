#pragma once

#include <exception>
#include <memory>
#include <string>

namespace catalog::error {

/*
  Rendered native cause.

  Captures the message of an underlying failure and, recursively, whatever
  it was nested around (std::throw_with_nested). Kept as plain data so it
  can be compared, copied and put on the wire without rethrowing.
*/
class ErrorCause {
 public:
  explicit ErrorCause(std::string message, std::shared_ptr<const ErrorCause> source = nullptr);

  static ErrorCause FromException(const std::exception& e);

  const std::string& Message() const {
    return message_;
  }

  // nullptr at the end of the chain
  const ErrorCause* Source() const {
    return source_.get();
  }

  // "<message>" followed by one "Caused by: <message>" line per link.
  std::string Render() const;

 private:
  std::string                       message_;
  std::shared_ptr<const ErrorCause> source_;
};

} // namespace catalog::error
