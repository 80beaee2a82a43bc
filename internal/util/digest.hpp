#pragma once

#include <string>
#include <string_view>

namespace dedup::util {

// Lowercase hex SHA-256 of the given bytes.
std::string Sha256Hex(std::string_view data);

} // namespace dedup::util
