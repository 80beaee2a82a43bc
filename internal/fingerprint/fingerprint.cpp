#include "fingerprint.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <vector>

#include "internal/fingerprint/unicode_fold.hpp"
#include "internal/util/strings.hpp"

namespace dedup::fingerprint {

namespace {

std::string StripPunctuation(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (!std::ispunct(static_cast<unsigned char>(c))) {
      out.push_back(c);
    }
  }
  return out;
}

bool IsProfileChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '%';
}

bool IsProfileSlug(std::string_view slug) {
  return !slug.empty() && std::all_of(slug.begin(), slug.end(), IsProfileChar);
}

std::vector<std::string_view> SplitPath(std::string_view path) {
  std::vector<std::string_view> segments;
  size_t                        start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    if (end > start) segments.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return segments;
}

// Path below linkedin.com, e.g. "in/johndoe/details".
std::string FromProfilePath(std::string_view path) {
  auto segments = SplitPath(path);
  if (segments.size() < 2) {
    return "";
  }

  const auto kind = segments[0];
  const auto slug = segments[1];
  if (!IsProfileSlug(slug)) {
    return "";
  }
  if (kind == "in" || kind == "pub") {
    return "linkedin.com/in/" + std::string(slug);
  }
  if (kind == "company") {
    return "linkedin.com/company/" + std::string(slug);
  }
  return "";
}

bool IsLinkedinHost(std::string_view host) {
  return host == "linkedin.com" || util::EndsWith(host, ".linkedin.com");
}

} // namespace

std::string Fingerprint(std::string_view value) {
  auto trimmed = util::Trim(value);
  if (trimmed.empty()) {
    return "";
  }

  auto folded  = util::AsciiLower(FoldToAscii(ToLowerUtf8(trimmed)));
  auto cleaned = StripPunctuation(folded);

  std::set<std::string> tokens;
  for (auto& token : util::SplitWhitespace(cleaned)) {
    tokens.insert(std::move(token));
  }

  std::string out;
  for (const auto& token : tokens) {
    if (!out.empty()) out.push_back(' ');
    out += token;
  }
  return out;
}

std::string NgramFingerprint(std::string_view value, std::size_t n) {
  std::string compact;
  for (char c : ToLowerUtf8(value)) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      compact.push_back(c);
    }
  }
  if (compact.empty()) {
    return "";
  }

  auto folded = StripPunctuation(util::AsciiLower(FoldToAscii(compact)));
  if (n == 0 || folded.size() < n) {
    return folded;
  }

  std::set<std::string> grams;
  for (std::size_t i = 0; i + n <= folded.size(); ++i) {
    grams.insert(folded.substr(i, n));
  }

  std::string out;
  for (const auto& gram : grams) {
    out += gram;
  }
  return out;
}

std::string NormalizePhone(std::string_view phone) {
  if (util::StartsWith(phone, "+1")) {
    phone.remove_prefix(2);
    while (!phone.empty() && std::isspace(static_cast<unsigned char>(phone.front()))) {
      phone.remove_prefix(1);
    }
  }

  std::string digits;
  for (char c : phone) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits.push_back(c);
    }
  }
  return digits;
}

std::string NormalizeLinkedin(std::string_view url) {
  std::string s = util::AsciiLower(util::Trim(url));
  if (s.empty()) {
    return "";
  }

  if (auto cut = s.find_first_of("?#"); cut != std::string::npos) {
    s.erase(cut);
  }
  if (auto scheme = s.find("://"); scheme != std::string::npos) {
    s.erase(0, scheme + 3);
  }
  while (!s.empty() && s.back() == '/') {
    s.pop_back();
  }
  if (s.empty() || s == "in" || s == "pub" || s == "company") {
    return "";
  }

  const auto slash = s.find('/');
  const auto host  = std::string_view(s).substr(0, slash);

  if (IsLinkedinHost(host)) {
    return slash == std::string::npos ? "" : FromProfilePath(std::string_view(s).substr(slash + 1));
  }

  // "in/<user>" or "company/<slug>" without a host
  if (util::StartsWith(s, "in/") || util::StartsWith(s, "pub/") || util::StartsWith(s, "company/")) {
    return FromProfilePath(s);
  }

  // bare username; anything with a dot or slash is some other site
  if (slash == std::string::npos && IsProfileSlug(s)) {
    return "linkedin.com/in/" + s;
  }

  return "";
}

} // namespace dedup::fingerprint
