#include "internal/fingerprint/similarity.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/resolution/detectors.hpp"

namespace {

using namespace dedup::fingerprint;

bool Near(double a, double b, double eps = 1e-3) {
  return std::fabs(a - b) < eps;
}

void TestLevenshtein() {
  assert(LevenshteinDistance("kitten", "sitting") == 3);
  assert(LevenshteinDistance("", "abc") == 3);
  assert(LevenshteinDistance("José", "Jose") == 1);
  assert(Near(NormalizedLevenshtein("kitten", "sitting"), 3.0 / 7.0));
  assert(NormalizedLevenshtein("", "") == 0.0);
  assert(NormalizedLevenshtein("abc", "abc") == 0.0);
}

void TestJaroAndJaroWinkler() {
  assert(Near(JaroSimilarity("MARTHA", "MARHTA"), 0.9444));
  assert(Near(JaroWinklerSimilarity("MARTHA", "MARHTA"), 0.9611));
  assert(Near(JaroWinklerSimilarity("DIXON", "DICKSONX"), 0.8133));
  assert(JaroWinklerSimilarity("same", "same") == 1.0);
  assert(JaroWinklerSimilarity("", "abc") == 0.0);
  assert(JaroWinklerSimilarity("abc", "xyz") == 0.0);
}

void TestFuzzyNameScores() {
  assert(JaroWinklerSimilarity("Jonathan Smith", "Jonathon Smith") >= 0.9);
  assert(JaroWinklerSimilarity("Jonathan Smith", "David Smith") < 0.9);
}

void TestEnsembleSimilarity() {
  assert(Near(EnsembleSimilarity("same", "same"), 1.0));
  const double jw  = JaroWinklerSimilarity("kitten", "sitting");
  const double lev = 1.0 - NormalizedLevenshtein("kitten", "sitting");
  assert(Near(EnsembleSimilarity("kitten", "sitting"), 0.6 * jw + 0.4 * lev, 1e-9));
  assert(Near(EnsembleSimilarity("kitten", "sitting", 1.0, 0.0), jw, 1e-9));
}

void TestMetaphone() {
  assert(Metaphone("Smith") == "SM0");
  assert(Metaphone("Smyth") == "SM0");
  assert(Metaphone("Knight") == "NT");
  assert(Metaphone("Phillips") == "FLPS");
  assert(Metaphone("").empty());
  assert(Metaphone("1234").empty());
}

void TestPhoneticBlockKeyFallback() {
  assert(dedup::resolution::PhoneticBlockKey("Smith") == "SM0");
  assert(dedup::resolution::PhoneticBlockKey("42") == "42");
  assert(dedup::resolution::PhoneticBlockKey("X") == "S");
}

} // namespace

int main() {
  TestLevenshtein();
  TestJaroAndJaroWinkler();
  TestFuzzyNameScores();
  TestEnsembleSimilarity();
  TestMetaphone();
  TestPhoneticBlockKeyFallback();

  std::cout << "dedup_unit_similarity: pass\n";
  return 0;
}
