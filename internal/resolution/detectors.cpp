#include "detectors.hpp"

#include <cctype>
#include <cstdio>
#include <map>

#include "internal/db/api/repository.hpp"
#include "internal/fingerprint/fingerprint.hpp"
#include "internal/fingerprint/similarity.hpp"
#include "internal/fingerprint/unicode_fold.hpp"
#include "internal/resolution/clusterer.hpp"
#include "internal/util/strings.hpp"

namespace dedup::resolution {

namespace {

using db::model::ContactRecord;

// key -> (label of first occurrence, distinct ids in first-seen order)
class KeyGroups {
 public:
  void Add(const std::string& key, const std::string& contact_id, const std::string& label) {
    auto [it, inserted] = groups_.try_emplace(key);
    auto& group         = it->second;
    if (inserted) group.label = label;
    for (const auto& id : group.ids) {
      if (id == contact_id) return;
    }
    group.ids.push_back(contact_id);
    group.names.push_back(label);
  }

  template <typename LabelFn>
  std::vector<MatchSignal> Signals(MatchType type, LabelFn&& label_fn) const {
    std::vector<MatchSignal> out;
    for (const auto& [key, group] : groups_) {
      if (group.ids.size() < 2) continue;
      out.push_back(MatchSignal{type, label_fn(key, group.label, group.names), group.ids});
    }
    return out;
  }

  std::vector<MatchSignal> Signals(MatchType type) const {
    return Signals(type, [](const std::string&, const std::string& label, const std::vector<std::string>&) { return label; });
  }

 private:
  struct Group {
    std::string              label;
    std::vector<std::string> ids;
    std::vector<std::string> names;
  };
  std::map<std::string, Group> groups_;
};

std::string Folded(const std::optional<std::string>& value) {
  return value ? fingerprint::ToLowerUtf8(util::Trim(*value)) : std::string();
}

bool HasValue(const std::optional<std::string>& value) {
  return value && !value->empty();
}

// "YYYY-MM-DD..." -> "MM-DD..."; nullopt for anything not shaped like a date.
std::optional<std::string> MonthDay(const std::string& birthday) {
  if (birthday.size() < 10 || birthday[4] != '-' || birthday[7] != '-') return std::nullopt;
  for (int i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!std::isdigit(static_cast<unsigned char>(birthday[i]))) return std::nullopt;
  }
  return birthday.substr(5);
}

std::string FormatScore(double score) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%.2f", score);
  return buf;
}

} // namespace

ContactSnapshot LoadSnapshot(db::Repository& repo) {
  auto tx       = repo.Begin();
  auto contacts = repo.ListContacts(*tx);
  tx->Commit();
  return contacts;
}

std::vector<MatchSignal> FindEmailDuplicates(const ContactSnapshot& contacts) {
  KeyGroups groups;
  for (const auto& contact : contacts) {
    if (contact.id.empty()) continue;
    for (const auto& email : contact.emails) {
      if (email.email.empty()) continue;
      auto key = util::AsciiLower(email.email);
      groups.Add(key, contact.id, key);
    }
  }
  return groups.Signals(MatchType::kEmail);
}

std::vector<MatchSignal> FindPhoneDuplicates(const ContactSnapshot& contacts) {
  KeyGroups groups;
  for (const auto& contact : contacts) {
    if (contact.id.empty()) continue;
    for (const auto& phone : contact.phones) {
      auto key = fingerprint::NormalizePhone(phone.phone_number);
      if (key.empty()) continue;
      groups.Add(key, contact.id, key);
    }
  }
  return groups.Signals(MatchType::kPhone);
}

std::vector<MatchSignal> FindBirthdayNameDuplicates(const ContactSnapshot& contacts, const std::string& placeholder_birthday) {
  KeyGroups groups;
  for (const auto& contact : contacts) {
    if (contact.id.empty() || !HasValue(contact.first_name) || !HasValue(contact.last_name) || !HasValue(contact.birthday)) {
      continue;
    }
    if (!placeholder_birthday.empty() && util::StartsWith(*contact.birthday, placeholder_birthday)) continue;

    auto month_day = MonthDay(*contact.birthday);
    if (!month_day) continue;

    const auto full_name = Folded(contact.first_name) + " " + Folded(contact.last_name);
    // '\x1f' cannot appear in a trimmed name, so the key is unambiguous
    groups.Add(full_name + '\x1f' + *month_day, contact.id, full_name + " (birthday: " + *month_day + ")");
  }
  return groups.Signals(MatchType::kBirthdayName);
}

std::vector<MatchSignal> FindFingerprintNameDuplicates(const ContactSnapshot& contacts) {
  KeyGroups groups;
  for (const auto& contact : contacts) {
    if (contact.id.empty() || !HasValue(contact.first_name) || !HasValue(contact.last_name)) continue;

    const auto full_name = *contact.first_name + " " + *contact.last_name;
    auto       key       = fingerprint::Fingerprint(full_name);
    if (key.empty()) continue;
    groups.Add(key, contact.id, full_name);
  }

  return groups.Signals(MatchType::kFingerprintName,
                        [](const std::string& key, const std::string&, const std::vector<std::string>& names) {
                          std::string joined;
                          for (const auto& name : names) {
                            if (!joined.empty()) joined += ", ";
                            joined += name;
                          }
                          return key + " (" + joined + ")";
                        });
}

std::vector<MatchSignal> FindNameTitleDuplicates(const ContactSnapshot& contacts) {
  KeyGroups groups;
  for (const auto& contact : contacts) {
    if (contact.id.empty() || !HasValue(contact.first_name) || !HasValue(contact.last_name) || !HasValue(contact.job_title)) {
      continue;
    }

    const auto full_name = Folded(contact.first_name) + " " + Folded(contact.last_name);
    const auto title     = Folded(contact.job_title);
    groups.Add(full_name + '\x1f' + title, contact.id, full_name + " | " + title);
  }
  return groups.Signals(MatchType::kNameTitle);
}

std::string PhoneticBlockKey(const std::string& last_name) {
  auto key = fingerprint::Metaphone(last_name);
  if (!key.empty()) return key;

  // nothing encodes (digits, non-Latin scripts)
  return fingerprint::PrefixCodePoints(fingerprint::ToLowerUtf8(last_name), 2);
}

std::vector<MatchSignal> FindFuzzyNameDuplicates(const ContactSnapshot& contacts, double threshold) {
  struct Candidate {
    std::string id;
    std::string full_name;
  };

  std::map<std::string, std::vector<Candidate>> blocks;
  for (const auto& contact : contacts) {
    if (contact.id.empty() || !contact.first_name || !contact.last_name) continue;

    auto first = util::Trim(*contact.first_name);
    auto last  = util::Trim(*contact.last_name);
    if (first.empty() || last.empty()) continue;

    blocks[PhoneticBlockKey(last)].push_back({contact.id, first + " " + last});
  }

  std::vector<MatchSignal> out;
  for (const auto& [_, items] : blocks) {
    for (size_t i = 0; i < items.size(); ++i) {
      for (size_t j = i + 1; j < items.size(); ++j) {
        const auto& a = items[i];
        const auto& b = items[j];
        if (a.id == b.id) continue;

        const double score = fingerprint::JaroWinklerSimilarity(a.full_name, b.full_name);
        if (score >= threshold) {
          out.push_back(MatchSignal{MatchType::kFuzzyName, a.full_name + " <-> " + b.full_name + " (" + FormatScore(score) + ")", {a.id, b.id}});
        }
      }
    }
  }
  return out;
}

std::vector<MatchSignal> FindLinkedinDuplicates(const ContactSnapshot& contacts) {
  KeyGroups groups;
  for (const auto& contact : contacts) {
    if (contact.id.empty() || !HasValue(contact.linkedin)) continue;

    auto key = fingerprint::NormalizeLinkedin(*contact.linkedin);
    if (key.empty()) continue;
    groups.Add(key, contact.id, key);
  }
  return groups.Signals(MatchType::kLinkedin);
}

DuplicateScan FindAllDuplicates(const ContactSnapshot& contacts, double fuzzy_threshold) {
  DuplicateScan scan;
  auto          append = [&scan](std::vector<MatchSignal> signals) {
    scan.signals.insert(scan.signals.end(), std::make_move_iterator(signals.begin()), std::make_move_iterator(signals.end()));
  };

  append(FindEmailDuplicates(contacts));
  append(FindPhoneDuplicates(contacts));
  append(FindNameTitleDuplicates(contacts));
  append(FindFuzzyNameDuplicates(contacts, fuzzy_threshold));

  scan.clusters = ClusterSignals(scan.signals);
  return scan;
}

} // namespace dedup::resolution
