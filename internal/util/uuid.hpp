#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace eryzaa::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 version 4 identifiers.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Lowercase hex without separators.
std::string ToHex(const UUID& id);

} // namespace eryzaa::util
