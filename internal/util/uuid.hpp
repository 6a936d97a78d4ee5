#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace transfer::util {

/*
  UUID helpers

  Transfer process ids are RFC4122 version 4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string GenerateUUIDString();

} // namespace transfer::util
