#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace nutrition::util {

/*
  UUID helpers

  Entity ids are RFC4122 version 4 UUIDs kept in their canonical
  lower-case textual form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Fresh id in textual form.
std::string NewId();

// True if str parses as a UUID (dashes optional, any hex case).
bool IsValidUUID(const std::string& str);

// Canonical lower-case dashed form of a parseable UUID string.
std::string CanonicalUUID(const std::string& str);

} // namespace nutrition::util
