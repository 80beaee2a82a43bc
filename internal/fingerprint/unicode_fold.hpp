#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace dedup::fingerprint {

/*
  Unicode helpers backed by ICU.

  FoldToAscii transliterates to Latin, strips accents and drops anything
  that still has no ASCII rendering ("Björk Guðmundsdóttir" -> "Bjork
  Gudmundsdottir", emoji -> "").
*/

std::string FoldToAscii(std::string_view utf8);

// Unicode-aware lowercase.
std::string ToLowerUtf8(std::string_view utf8);

// First n code points of a UTF-8 string.
std::string PrefixCodePoints(std::string_view utf8, std::size_t n);

// Decode to code points; malformed sequences become U+FFFD.
std::u32string ToCodePoints(std::string_view utf8);

} // namespace dedup::fingerprint
