#include "internal/fingerprint/fingerprint.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/fingerprint/unicode_fold.hpp"

namespace {

using dedup::fingerprint::Fingerprint;
using dedup::fingerprint::NgramFingerprint;
using dedup::fingerprint::NormalizeLinkedin;
using dedup::fingerprint::NormalizePhone;

void TestFingerprintIgnoresOrderCaseAndPunctuation() {
  const auto expected = Fingerprint("Tom Cruise");
  assert(expected == "cruise tom");
  assert(Fingerprint("Cruise, Tom") == expected);
  assert(Fingerprint("TOM CRUISE") == expected);
  assert(Fingerprint("  tom   tom cruise ") == expected);
}

void TestFingerprintFoldsAccents() {
  assert(Fingerprint("José García") == "garcia jose");
  assert(Fingerprint("Björk Guðmundsdóttir") == "bjork gudmundsdottir");
  assert(dedup::fingerprint::FoldToAscii("Zoë") == "Zoe");
}

void TestFingerprintEmptyInput() {
  assert(Fingerprint("").empty());
  assert(Fingerprint("   ").empty());
  assert(NgramFingerprint("").empty());
}

void TestNgramFingerprint() {
  assert(NgramFingerprint("abab") == "abba");
  assert(NgramFingerprint("A B A B") == "abba");
  assert(NgramFingerprint("x", 2) == "x");
}

void TestNormalizePhone() {
  assert(NormalizePhone("(555) 123-4567") == "5551234567");
  assert(NormalizePhone("+1 555-123-4567") == "5551234567");
  assert(NormalizePhone("555.123.4567") == "5551234567");
  assert(NormalizePhone("+44 20 7946 0958") == "442079460958");
  assert(NormalizePhone("no digits").empty());
}

void TestNormalizeLinkedinProfiles() {
  assert(NormalizeLinkedin("https://www.linkedin.com/in/JohnDoe/?trk=abc") == "linkedin.com/in/johndoe");
  assert(NormalizeLinkedin("http://linkedin.com/in/johndoe#about") == "linkedin.com/in/johndoe");
  assert(NormalizeLinkedin("linkedin.com/pub/jane-doe") == "linkedin.com/in/jane-doe");
  assert(NormalizeLinkedin("https://uk.linkedin.com/in/jane-doe/details/experience") == "linkedin.com/in/jane-doe");
  assert(NormalizeLinkedin("https://linkedin.com/company/acme-inc/") == "linkedin.com/company/acme-inc");
  assert(NormalizeLinkedin("in/johndoe") == "linkedin.com/in/johndoe");
  assert(NormalizeLinkedin("johndoe") == "linkedin.com/in/johndoe");
}

void TestNormalizeLinkedinRejectsOtherInput() {
  assert(NormalizeLinkedin("").empty());
  assert(NormalizeLinkedin("in/").empty());
  assert(NormalizeLinkedin("https://linkedin.com").empty());
  assert(NormalizeLinkedin("https://linkedin.com/feed/").empty());
  assert(NormalizeLinkedin("https://example.com/in/johndoe").empty());
  assert(NormalizeLinkedin("john.doe@example.com").empty());
}

void TestNormalizeLinkedinIsStable() {
  for (const std::string input : {"https://www.linkedin.com/in/JohnDoe/", "johndoe", "linkedin.com/company/acme"}) {
    const auto once = NormalizeLinkedin(input);
    assert(!once.empty());
    assert(NormalizeLinkedin(once) == once);
    assert(NormalizeLinkedin(once + "/") == once);
  }
}

} // namespace

int main() {
  TestFingerprintIgnoresOrderCaseAndPunctuation();
  TestFingerprintFoldsAccents();
  TestFingerprintEmptyInput();
  TestNgramFingerprint();
  TestNormalizePhone();
  TestNormalizeLinkedinProfiles();
  TestNormalizeLinkedinRejectsOtherInput();
  TestNormalizeLinkedinIsStable();

  std::cout << "dedup_unit_fingerprint: pass\n";
  return 0;
}
