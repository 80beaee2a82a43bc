#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace dedup::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 version 4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// First 8 hex characters of a fresh UUID; used as a duplicate group id.
std::string ShortId();

} // namespace dedup::util
