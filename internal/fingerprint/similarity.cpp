#include "similarity.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "internal/fingerprint/unicode_fold.hpp"
#include "internal/util/strings.hpp"

namespace dedup::fingerprint {

namespace {

std::size_t Levenshtein(const std::u32string& a, const std::u32string& b) {
  if (a.empty()) return b.size();
  if (b.empty()) return a.size();

  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> curr(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;

  for (std::size_t i = 1; i <= a.size(); ++i) {
    curr[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      curr[j]                = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }
  return prev[b.size()];
}

double Jaro(const std::u32string& s1, const std::u32string& s2, bool winklerize) {
  const std::size_t len1 = s1.size();
  const std::size_t len2 = s2.size();
  if (len1 == 0 || len2 == 0) {
    return 0.0;
  }

  std::size_t search_range = std::max(len1, len2) / 2;
  search_range             = search_range > 0 ? search_range - 1 : 0;

  std::vector<bool> flags1(len1, false);
  std::vector<bool> flags2(len2, false);
  std::size_t       common = 0;

  for (std::size_t i = 0; i < len1; ++i) {
    const std::size_t low = i > search_range ? i - search_range : 0;
    const std::size_t hi  = std::min(i + search_range, len2 - 1);
    for (std::size_t j = low; j <= hi; ++j) {
      if (!flags2[j] && s2[j] == s1[i]) {
        flags1[i] = flags2[j] = true;
        ++common;
        break;
      }
    }
  }

  if (common == 0) {
    return 0.0;
  }

  std::size_t transpositions = 0;
  std::size_t k              = 0;
  for (std::size_t i = 0; i < len1; ++i) {
    if (!flags1[i]) continue;
    std::size_t j = k;
    while (j < len2 && !flags2[j]) ++j;
    k = j + 1;
    if (j < len2 && s1[i] != s2[j]) ++transpositions;
  }
  transpositions /= 2;

  const double m      = static_cast<double>(common);
  double       weight = (m / static_cast<double>(len1) + m / static_cast<double>(len2) + (m - static_cast<double>(transpositions)) / m) / 3.0;

  if (winklerize && weight > 0.7) {
    const std::size_t max_prefix = std::min<std::size_t>({len1, len2, 4});
    std::size_t       prefix     = 0;
    while (prefix < max_prefix && s1[prefix] == s2[prefix]) ++prefix;
    weight += static_cast<double>(prefix) * 0.1 * (1.0 - weight);
  }
  return weight;
}

bool IsVowel(char c) {
  return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

bool OneOf(char c, std::string_view set) {
  return c != '\0' && set.find(c) != std::string_view::npos;
}

} // namespace

std::size_t LevenshteinDistance(std::string_view a, std::string_view b) {
  return Levenshtein(ToCodePoints(a), ToCodePoints(b));
}

double NormalizedLevenshtein(std::string_view a, std::string_view b) {
  const auto ca      = ToCodePoints(a);
  const auto cb      = ToCodePoints(b);
  const auto max_len = std::max(ca.size(), cb.size());
  if (max_len == 0) {
    return 0.0;
  }
  return static_cast<double>(Levenshtein(ca, cb)) / static_cast<double>(max_len);
}

double JaroSimilarity(std::string_view a, std::string_view b) {
  return Jaro(ToCodePoints(a), ToCodePoints(b), false);
}

double JaroWinklerSimilarity(std::string_view a, std::string_view b) {
  return Jaro(ToCodePoints(a), ToCodePoints(b), true);
}

double EnsembleSimilarity(std::string_view a, std::string_view b, double jw_weight, double lev_weight) {
  const double jw  = JaroWinklerSimilarity(a, b);
  const double lev = 1.0 - NormalizedLevenshtein(a, b);
  return jw_weight * jw + lev_weight * lev;
}

std::string Metaphone(std::string_view word) {
  std::string s = util::AsciiLower(FoldToAscii(ToLowerUtf8(word)));

  for (std::string_view prefix : {"kn", "gn", "pn", "wr", "ae"}) {
    if (util::StartsWith(s, prefix)) {
      s.erase(0, 1);
      break;
    }
  }

  // '\0' marks "past the end"; it never matches a letter set
  auto at = [&s](std::size_t i) -> char { return i < s.size() ? s[i] : '\0'; };

  std::string out;
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char c        = s[i];
    const char next     = at(i + 1);
    const char nextnext = at(i + 2);

    if (c == next && c != 'c') {
      continue;
    }

    switch (c) {
      case 'a':
      case 'e':
      case 'i':
      case 'o':
      case 'u':
        if (i == 0 || s[i - 1] == ' ') out.push_back(c);
        break;
      case 'b':
        out.push_back('b');
        break;
      case 'c':
        if ((next == 'i' && nextnext == 'a') || next == 'h') {
          out.push_back('x');
          ++i;
        } else if (OneOf(next, "iey")) {
          out.push_back('s');
          ++i;
        } else {
          out.push_back('k');
        }
        break;
      case 'd':
        if (next == 'g' && OneOf(nextnext, "iey")) {
          out.push_back('j');
          i += 2;
        } else {
          out.push_back('t');
        }
        break;
      case 'f':
      case 'j':
      case 'l':
      case 'm':
      case 'n':
      case 'r':
        out.push_back(c);
        break;
      case 'g':
        if (OneOf(next, "iey")) {
          out.push_back('j');
        } else if (next == 'h' && !IsVowel(nextnext)) {
          ++i;
        } else {
          out.push_back('k');
        }
        break;
      case 'h':
        if (i == 0 || IsVowel(next) || !IsVowel(s[i - 1])) out.push_back('h');
        break;
      case 'k':
        if (i == 0 || s[i - 1] != 'c') out.push_back('k');
        break;
      case 'p':
        if (next == 'h') {
          out.push_back('f');
          ++i;
        } else {
          out.push_back('p');
        }
        break;
      case 'q':
        out.push_back('k');
        break;
      case 's':
        if (next == 'h') {
          out.push_back('x');
          ++i;
        } else if (next == 'i' && OneOf(nextnext, "oa")) {
          out.push_back('x');
          i += 2;
        } else {
          out.push_back('s');
        }
        break;
      case 't':
        if (next == 'i' && OneOf(nextnext, "oa")) {
          out.push_back('x');
        } else if (next == 'h') {
          out.push_back('0');
          ++i;
        } else if (next != 'c' || nextnext != 'h') {
          out.push_back('t');
        }
        break;
      case 'v':
        out.push_back('f');
        break;
      case 'w':
        if (i == 0 && next == 'h') {
          ++i;
          out.push_back('w');
        } else if (IsVowel(next)) {
          out.push_back('w');
        }
        break;
      case 'x':
        if (i == 0) {
          out.push_back(next == 'h' || (next == 'i' && OneOf(nextnext, "oa")) ? 'x' : 's');
        } else {
          out += "ks";
        }
        break;
      case 'y':
        if (IsVowel(next)) out.push_back('y');
        break;
      case 'z':
        out.push_back('s');
        break;
      case ' ':
        if (!out.empty() && out.back() != ' ') out.push_back(' ');
        break;
      default:
        break;
    }
  }

  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

} // namespace dedup::fingerprint
