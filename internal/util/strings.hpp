#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dedup::util {

std::string Trim(std::string_view sv);

// ASCII-only lowercase; multi-byte sequences pass through untouched.
std::string AsciiLower(std::string_view sv);

bool StartsWith(std::string_view s, std::string_view prefix);
bool EndsWith(std::string_view s, std::string_view suffix);

std::vector<std::string> SplitWhitespace(std::string_view sv);

} // namespace dedup::util
