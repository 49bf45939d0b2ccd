#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace catalog::util {

/*
  UUID helpers

  Identifiers are raw 16 byte RFC4122 UUIDs rendered in the canonical
  lowercase 8-4-4-4-12 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Accepts hyphenated or plain 32 hex digit input; throws std::invalid_argument.
UUID FromString(const std::string& str);

} // namespace catalog::util
