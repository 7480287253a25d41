#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace vaultd::util {

/*
  UUID helpers

  Page and block ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Convenience for the notes store.
inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace vaultd::util
