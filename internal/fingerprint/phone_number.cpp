#include "phone_number.hpp"

#include <cctype>

#include <phonenumbers/phonenumberutil.h>

#include "internal/fingerprint/fingerprint.hpp"
#include "internal/util/strings.hpp"

namespace dedup::fingerprint {

namespace {

using i18n::phonenumbers::PhoneNumberUtil;

std::string UpperRegion(std::string_view region) {
  std::string upper(util::Trim(region));
  for (auto& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return upper;
}

PhoneNumberUtil::PhoneNumberFormat ToLibraryFormat(PhoneFormat format) {
  switch (format) {
    case PhoneFormat::kInternational:
      return PhoneNumberUtil::INTERNATIONAL;
    case PhoneFormat::kNational:
      return PhoneNumberUtil::NATIONAL;
    case PhoneFormat::kE164:
      break;
  }
  return PhoneNumberUtil::E164;
}

} // namespace

PhoneFormat ParsePhoneFormat(std::string_view name) {
  const auto lowered = util::AsciiLower(name);
  if (lowered == "international") return PhoneFormat::kInternational;
  if (lowered == "national") return PhoneFormat::kNational;
  return PhoneFormat::kE164;
}

std::optional<PhoneNumber> ParsePhoneNumber(std::string_view input, std::string_view default_region) {
  const auto trimmed = util::Trim(input);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  const auto* phone_util = PhoneNumberUtil::GetInstance();
  PhoneNumber number;
  const auto  status     = phone_util->Parse(trimmed, UpperRegion(default_region), &number.parsed);
  if (status != PhoneNumberUtil::NO_PARSING_ERROR) {
    return std::nullopt;
  }

  number.country_code = number.parsed.country_code();
  phone_util->GetNationalSignificantNumber(number.parsed, &number.national_number);
  phone_util->GetRegionCodeForNumber(number.parsed, &number.region);
  if (number.region.empty() || number.region == "ZZ") {
    // numbers outside any region's ranges still belong to the country's main region
    phone_util->GetRegionCodeForCountryCode(number.country_code, &number.region);
  }
  number.possible = phone_util->IsPossibleNumber(number.parsed);
  number.valid    = phone_util->IsValidNumber(number.parsed);
  return number;
}

std::string FormatPhoneNumber(const PhoneNumber& number, PhoneFormat format) {
  std::string out;
  PhoneNumberUtil::GetInstance()->Format(number.parsed, ToLibraryFormat(format), &out);
  return out;
}

std::string NormalizePhoneE164(std::string_view input, std::string_view default_region, bool strict) {
  if (util::Trim(input).empty()) {
    return "";
  }

  auto parsed = ParsePhoneNumber(input, default_region);
  if (parsed && (strict ? parsed->valid : parsed->possible)) {
    return FormatPhoneNumber(*parsed, PhoneFormat::kE164);
  }
  return strict ? "" : NormalizePhone(input);
}

std::string FormatPhone(std::string_view input, std::string_view format, std::string_view default_region) {
  if (util::Trim(input).empty()) {
    return "";
  }

  auto parsed = ParsePhoneNumber(input, default_region);
  if (!parsed || !parsed->possible) {
    return std::string(input);
  }
  return FormatPhoneNumber(*parsed, ParsePhoneFormat(format));
}

} // namespace dedup::fingerprint
