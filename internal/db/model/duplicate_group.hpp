#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dedup::db::model {

enum class DuplicateResolution { kUnset, kConfirmed, kFalsePositive };

inline std::string_view ToString(DuplicateResolution resolution) {
  switch (resolution) {
    case DuplicateResolution::kConfirmed:
      return "confirmed";
    case DuplicateResolution::kFalsePositive:
      return "false_positive";
    case DuplicateResolution::kUnset:
      break;
  }
  return "";
}

// Unknown or empty text reads as kUnset.
inline DuplicateResolution ParseResolution(std::string_view text) {
  if (text == "confirmed") return DuplicateResolution::kConfirmed;
  if (text == "false_positive") return DuplicateResolution::kFalsePositive;
  return DuplicateResolution::kUnset;
}

/*
  Review state carried on a contact row.

  Survives every re-sync of the contact's other fields.
*/
struct DuplicateGroup {
  std::optional<std::string> group_id;
  DuplicateResolution        resolution = DuplicateResolution::kUnset;
  std::optional<std::string> primary_contact_id;

  bool operator==(const DuplicateGroup&) const = default;
};

} // namespace dedup::db::model
