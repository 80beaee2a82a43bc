#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dedup::resolution {

enum class MatchType {
  kEmail,
  kPhone,
  kBirthdayName,
  kFingerprintName,
  kNameTitle,
  kFuzzyName,
  kLinkedin,
};

inline std::string_view ToString(MatchType type) {
  switch (type) {
    case MatchType::kEmail:
      return "email";
    case MatchType::kPhone:
      return "phone";
    case MatchType::kBirthdayName:
      return "birthday_name";
    case MatchType::kFingerprintName:
      return "fingerprint_name";
    case MatchType::kNameTitle:
      return "name_title";
    case MatchType::kFuzzyName:
      return "fuzzy_name";
    case MatchType::kLinkedin:
      break;
  }
  return "linkedin";
}

/*
  One piece of duplicate evidence.

  contact_ids holds at least two distinct ids in first-seen order;
  match_value is diagnostic text only.
*/
struct MatchSignal {
  MatchType                type;
  std::string              match_value;
  std::vector<std::string> contact_ids;
};

using Cluster = std::vector<std::string>;

} // namespace dedup::resolution
