#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace catalog::error {

/*
  OperationError

  Closed set of the errors one catalog operation may raise. Converting any
  member error into the operation error appends Context to its stack; this
  is the one place operation context gets injected.

    using RenameWarehouseError =
        OperationError<kRenameWarehouseContext, CatalogBackendError, WarehouseIdNotFound>;

  Context must be a namespace scope constexpr char array so that each
  operation is a distinct type.
*/
template <const char* Context, typename... Errors>
class OperationError : public std::exception {
 public:
  using Variant = std::variant<Errors...>;

  template <typename E>
    requires(std::is_same_v<std::remove_cvref_t<E>, Errors> || ...)
  OperationError(E&& error) : error_(std::forward<E>(error)) {  // NOLINT(google-explicit-constructor)
    AppendDetail(std::string(Context));
  }

  static constexpr std::string_view ContextDetail() {
    return Context;
  }

  /*
    Runs a backend call and re-raises any member error it throws as this
    operation's error. Other exception types propagate untouched.
  */
  template <typename Fn>
  static decltype(auto) Capture(Fn&& fn) {
    return CaptureAs<Errors...>(fn);
  }

  const char* what() const noexcept override {
    return std::visit([](const auto& e) { return e.what(); }, error_);
  }

  const Variant& Error() const {
    return error_;
  }

  template <typename E>
  bool Is() const {
    return std::holds_alternative<E>(error_);
  }

  template <typename E>
  const E& As() const {
    return std::get<E>(error_);
  }

  const std::vector<std::string>& Stack() const {
    return std::visit([](const auto& e) -> const std::vector<std::string>& { return e.Stack(); }, error_);
  }

  OperationError& AppendDetail(std::string detail) & {
    std::visit([&detail](auto& e) { e.AppendDetail(std::move(detail)); }, error_);
    return *this;
  }

  OperationError AppendDetail(std::string detail) && {
    AppendDetail(std::move(detail));
    return std::move(*this);
  }

 private:
  template <typename First, typename... Rest, typename Fn>
  static decltype(auto) CaptureAs(Fn& fn) {
    try {
      if constexpr (sizeof...(Rest) == 0) {
        return fn();
      } else {
        return CaptureAs<Rest...>(fn);
      }
    } catch (First& e) {
      throw OperationError(std::move(e));
    }
  }

  Variant error_;
};

} // namespace catalog::error
