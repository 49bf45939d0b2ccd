#pragma once

#include <string>
#include <utility>
#include <vector>

namespace catalog::error {

/*
  ErrorStack

  Ordered, append-only list of human readable context lines, oldest first.
  Every layer that re-wraps an error adds one line naming what it was
  trying to do.

  Mixed into each error type through CRTP:

    auto err = WarehouseNotEmpty().AppendDetail("deleting warehouse");  // by value
    err.AppendDetail("handling request");                              // in place
*/
template <typename Derived>
class ErrorStack {
 public:
  const std::vector<std::string>& Stack() const {
    return stack_;
  }

  Derived& AppendDetail(std::string detail) & {
    stack_.push_back(std::move(detail));
    return Self();
  }

  Derived AppendDetail(std::string detail) && {
    stack_.push_back(std::move(detail));
    return std::move(Self());
  }

  Derived& AppendDetails(std::vector<std::string> details) & {
    MoveInto(std::move(details));
    return Self();
  }

  Derived AppendDetails(std::vector<std::string> details) && {
    MoveInto(std::move(details));
    return std::move(Self());
  }

 protected:
  ErrorStack() = default;

 private:
  Derived& Self() {
    return static_cast<Derived&>(*this);
  }

  void MoveInto(std::vector<std::string> details) {
    stack_.reserve(stack_.size() + details.size());
    for (auto& detail : details) {
      stack_.push_back(std::move(detail));
    }
  }

  std::vector<std::string> stack_;
};

} // namespace catalog::error
