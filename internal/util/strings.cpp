#include "strings.hpp"

#include <cctype>

namespace dedup::util {

std::string Trim(std::string_view sv) {
  size_t b = 0;
  while (b < sv.size() && std::isspace(static_cast<unsigned char>(sv[b]))) b++;
  size_t e = sv.size();
  while (e > b && std::isspace(static_cast<unsigned char>(sv[e - 1]))) e--;
  return std::string(sv.substr(b, e - b));
}

std::string AsciiLower(std::string_view sv) {
  std::string out(sv);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::vector<std::string> SplitWhitespace(std::string_view sv) {
  std::vector<std::string> tokens;
  size_t                   i = 0;
  while (i < sv.size()) {
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) i++;
    size_t start = i;
    while (i < sv.size() && !std::isspace(static_cast<unsigned char>(sv[i]))) i++;
    if (i > start) tokens.emplace_back(sv.substr(start, i - start));
  }
  return tokens;
}

} // namespace dedup::util
