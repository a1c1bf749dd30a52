#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace warranty::util {

/*
  UUID helpers

  Entity identities are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

bool IsUUID(const std::string& str);

} // namespace warranty::util
