#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace dedup::fingerprint {

/*
  String similarity primitives.

  Inputs are UTF-8 and compared per code point. Scores are in [0, 1].
*/

std::size_t LevenshteinDistance(std::string_view a, std::string_view b);

// Edit distance divided by the longer length: 0.0 identical, 1.0 disjoint.
double NormalizedLevenshtein(std::string_view a, std::string_view b);

double JaroSimilarity(std::string_view a, std::string_view b);

// Jaro with the Winkler prefix boost (scale 0.1, up to 4 chars) applied
// when the Jaro score exceeds 0.7.
double JaroWinklerSimilarity(std::string_view a, std::string_view b);

double EnsembleSimilarity(std::string_view a, std::string_view b, double jw_weight = 0.6, double lev_weight = 0.4);

// Original Metaphone encoding, uppercase. Returns "" when nothing encodes.
std::string Metaphone(std::string_view word);

} // namespace dedup::fingerprint
