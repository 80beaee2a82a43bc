#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <phonenumbers/phonenumber.pb.h>

namespace dedup::fingerprint {

/*
  Telephone numbering-plan support on top of libphonenumber.

  Parsing accepts an explicit "+<cc>" prefix or falls back to the caller's
  default region (trunk prefixes such as "0" or "8" are handled by the
  plan metadata). Strict normalization requires a valid number; the lenient
  path only requires a possible length for the country.
*/

enum class PhoneFormat { kE164, kInternational, kNational };

// Case-insensitive "E164" | "INTERNATIONAL" | "NATIONAL"; anything else is E164.
PhoneFormat ParsePhoneFormat(std::string_view name);

struct PhoneNumber {
  std::string                     region;
  int                             country_code = 0;
  std::string                     national_number;
  bool                            possible     = false;
  bool                            valid        = false;
  i18n::phonenumbers::PhoneNumber parsed;
};

// nullopt when the text is not a number or the region is unknown.
std::optional<PhoneNumber> ParsePhoneNumber(std::string_view input, std::string_view default_region);

std::string FormatPhoneNumber(const PhoneNumber& number, PhoneFormat format);

// E.164 form; strict returns "" unless the number is valid, otherwise falls back to NormalizePhone.
std::string NormalizePhoneE164(std::string_view input, std::string_view default_region = "US", bool strict = false);

// Reformats a number; unparseable input is returned unchanged, blank input yields "".
std::string FormatPhone(std::string_view input, std::string_view format = "E164", std::string_view default_region = "US");

} // namespace dedup::fingerprint
