#include "internal/fingerprint/phone_number.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace dedup::fingerprint;

void TestParsePhoneFormat() {
  assert(ParsePhoneFormat("E164") == PhoneFormat::kE164);
  assert(ParsePhoneFormat("international") == PhoneFormat::kInternational);
  assert(ParsePhoneFormat("National") == PhoneFormat::kNational);
  assert(ParsePhoneFormat("rfc3966") == PhoneFormat::kE164);
  assert(ParsePhoneFormat("") == PhoneFormat::kE164);
}

void TestParseWithDefaultRegion() {
  auto parsed = ParsePhoneNumber("(555) 123-4567", "US");
  assert(parsed.has_value());
  assert(parsed->region == "US");
  assert(parsed->country_code == 1);
  assert(parsed->national_number == "5551234567");
  assert(parsed->possible);

  auto trunk = ParsePhoneNumber("1 555 123 4567", "us");
  assert(trunk.has_value());
  assert(trunk->national_number == "5551234567");

  auto gb = ParsePhoneNumber("020 7946 0958", "GB");
  assert(gb.has_value());
  assert(gb->country_code == 44);
  assert(gb->national_number == "2079460958");

  auto ru = ParsePhoneNumber("8 912 345-67-89", "RU");
  assert(ru.has_value());
  assert(ru->country_code == 7);
  assert(ru->national_number == "9123456789");
}

void TestParseWithCountryCode() {
  auto gb = ParsePhoneNumber("+44 20 7946 0958", "US");
  assert(gb.has_value());
  assert(gb->region == "GB");
  assert(gb->national_number == "2079460958");

  auto us = ParsePhoneNumber("+1-555-123-4567", "GB");
  assert(us.has_value());
  assert(us->country_code == 1);
}

void TestParseRejectsGarbage() {
  assert(!ParsePhoneNumber("", "US").has_value());
  assert(!ParsePhoneNumber("call me maybe", "US").has_value());
  assert(!ParsePhoneNumber("5551234567", "ZZ").has_value());
  assert(!ParsePhoneNumber("5551234567", "").has_value());
}

void TestStrictNormalizationAcrossCountries() {
  assert(NormalizePhoneE164("+7 912 345-67-89", "US", true) == "+79123456789");
  assert(NormalizePhoneE164("+20 10 1234 5678", "US", true) == "+201012345678");
  assert(NormalizePhoneE164("+90 532 123 45 67", "US", true) == "+905321234567");
  assert(NormalizePhoneE164("+62 812 3456 7890", "US", true) == "+6281234567890");
  assert(NormalizePhoneE164("8 912 345-67-89", "RU", true) == "+79123456789");
  assert(NormalizePhoneE164("+44 20 7946 0958", "US", true) == "+442079460958");
}

void TestFormatPhone() {
  assert(FormatPhone("(555) 123-4567") == "+15551234567");
  assert(FormatPhone("555.123.4567", "national") == "(555) 123-4567");
  assert(FormatPhone("+1 555 123 4567", "INTERNATIONAL") == "+1 555-123-4567");
  assert(FormatPhone("020 7946 0958", "E164", "GB") == "+442079460958");
  assert(FormatPhone("020 7946 0958", "INTERNATIONAL", "GB") == "+44 20 7946 0958");
  assert(FormatPhone("+44 20 7946 0958", "NATIONAL") == "020 7946 0958");
  assert(FormatPhone("555-123-4567", "bogus") == "+15551234567");
  assert(FormatPhone("+15551234567", "NATIONAL") == FormatPhone("+15551234567", "national"));
}

void TestFormatPhoneEdgeCases() {
  assert(FormatPhone("").empty());
  assert(FormatPhone("   ").empty());
  assert(FormatPhone("not a phone") == "not a phone");
  assert(FormatPhone("12") == "12");
}

void TestNormalizePhoneE164() {
  assert(NormalizePhoneE164("(555) 123-4567") == "+15551234567");
  assert(NormalizePhoneE164("+15551234567") == "+15551234567");
  assert(NormalizePhoneE164("   ").empty());
  assert(NormalizePhoneE164("123", "US", true).empty());
  assert(NormalizePhoneE164("12", "US", false) == "12");
  assert(NormalizePhoneE164("2079460958", "US") != NormalizePhoneE164("2079460958", "GB"));
}

} // namespace

int main() {
  TestParsePhoneFormat();
  TestParseWithDefaultRegion();
  TestParseWithCountryCode();
  TestParseRejectsGarbage();
  TestStrictNormalizationAcrossCountries();
  TestFormatPhone();
  TestFormatPhoneEdgeCases();
  TestNormalizePhoneE164();

  std::cout << "dedup_unit_phone_number: pass\n";
  return 0;
}
