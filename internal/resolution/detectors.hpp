#pragma once

#include <string>
#include <vector>

#include "internal/db/model/contact_record.hpp"
#include "internal/resolution/match_signal.hpp"

namespace dedup::db {
class Repository;
}

namespace dedup::resolution {

/*
  Duplicate detectors.

  Every detector is a pure pass over a contact snapshot: records missing the
  fields a detector keys on are skipped, never reported as errors. Output is
  deterministic for a given snapshot (groups in key order, ids in first-seen
  order, each id at most once per signal).
*/

using ContactSnapshot = std::vector<db::model::ContactRecord>;

constexpr double kDefaultFuzzyThreshold = 0.9;
constexpr const char* kPlaceholderBirthday = "2001-01-01";

// Reads every contact with its email/phone rows in one transaction.
ContactSnapshot LoadSnapshot(db::Repository& repo);

std::vector<MatchSignal> FindEmailDuplicates(const ContactSnapshot& contacts);

std::vector<MatchSignal> FindPhoneDuplicates(const ContactSnapshot& contacts);

// Same first/last name and birthday month-day; birthdays starting with the
// placeholder date are ignored.
std::vector<MatchSignal> FindBirthdayNameDuplicates(const ContactSnapshot& contacts,
                                                    const std::string& placeholder_birthday = kPlaceholderBirthday);

std::vector<MatchSignal> FindFingerprintNameDuplicates(const ContactSnapshot& contacts);

std::vector<MatchSignal> FindNameTitleDuplicates(const ContactSnapshot& contacts);

// Blocks by Metaphone(surname), compares full names pairwise with
// Jaro-Winkler inside each block. One signal per pair.
std::vector<MatchSignal> FindFuzzyNameDuplicates(const ContactSnapshot& contacts, double threshold = kDefaultFuzzyThreshold);

std::vector<MatchSignal> FindLinkedinDuplicates(const ContactSnapshot& contacts);

// Surname blocking key; falls back to the first two lowercase letters.
std::string PhoneticBlockKey(const std::string& last_name);

struct DuplicateScan {
  std::vector<MatchSignal> signals;
  std::vector<Cluster>     clusters;
};

// Email + phone + name/title + fuzzy name, clustered.
DuplicateScan FindAllDuplicates(const ContactSnapshot& contacts, double fuzzy_threshold);

} // namespace dedup::resolution
