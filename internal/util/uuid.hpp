#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace pulsetx::util {

/*
  UUID helpers

  Record and session identifiers are RFC4122 v4 UUIDs,
  carried as their canonical 36 character string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace pulsetx::util
