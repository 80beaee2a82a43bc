#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace dedup::fingerprint {

/*
  Canonical keys used by the match detectors.

  All functions are pure and accept arbitrary UTF-8; empty input yields "".
*/

// Case/accent/punctuation/order-insensitive token key:
// "Cruise, Tom" and "TOM CRUISE" both become "cruise tom".
std::string Fingerprint(std::string_view value);

// Sorted, de-duplicated character n-grams of the folded value.
// Values shorter than n are returned as folded.
std::string NgramFingerprint(std::string_view value, std::size_t n = 2);

// Drops a leading "+1" then every non-digit.
std::string NormalizePhone(std::string_view phone);

// Canonical "linkedin.com/in/<user>" or "linkedin.com/company/<slug>",
// "" when the input is not a recognizable profile.
std::string NormalizeLinkedin(std::string_view url);

} // namespace dedup::fingerprint
