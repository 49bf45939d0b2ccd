#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>

#include "internal/util/uuid.hpp"

namespace catalog::model {

/*
  Strongly typed UUID identifier.

  Each tag yields a distinct type so a ProjectId can never be passed where a
  WarehouseId is expected.
*/
template <typename Tag>
class TypedId {
 public:
  TypedId() = default;
  explicit TypedId(util::UUID value) : value_(value) {
  }

  static TypedId Generate() {
    return TypedId(util::GenerateUUID());
  }

  static TypedId FromString(const std::string& text) {
    return TypedId(util::FromString(text));
  }

  const util::UUID& Value() const {
    return value_;
  }

  std::string ToString() const {
    return util::ToString(value_);
  }

  friend bool operator==(const TypedId&, const TypedId&)  = default;
  friend auto operator<=>(const TypedId&, const TypedId&) = default;

 private:
  util::UUID value_{};
};

struct WarehouseIdTag;
struct ProjectIdTag;
struct SecretIdentTag;

using WarehouseId = TypedId<WarehouseIdTag>;
using ProjectId   = TypedId<ProjectIdTag>;
using SecretIdent = TypedId<SecretIdentTag>;

} // namespace catalog::model

template <typename Tag>
struct std::hash<catalog::model::TypedId<Tag>> {
  std::size_t operator()(const catalog::model::TypedId<Tag>& id) const noexcept {
    std::size_t seed = 0;
    for (auto b : id.Value()) {
      seed = seed * 131 + b;
    }
    return seed;
  }
};
