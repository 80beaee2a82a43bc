#include "internal/resolution/detectors.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using dedup::db::model::ContactRecord;
using namespace dedup::resolution;

ContactRecord MakeContact(const std::string& id, std::optional<std::string> first, std::optional<std::string> last,
                          std::optional<std::string> title = std::nullopt) {
  ContactRecord contact;
  contact.id         = id;
  contact.first_name = std::move(first);
  contact.last_name  = std::move(last);
  contact.job_title  = std::move(title);
  return contact;
}

void AddEmail(ContactRecord& contact, const std::string& email) {
  contact.emails.push_back({static_cast<int64_t>(contact.emails.size() + 1), contact.id, email});
}

void AddPhone(ContactRecord& contact, const std::string& number) {
  contact.phones.push_back({static_cast<int64_t>(contact.phones.size() + 1), contact.id, number, ""});
}

bool SameIds(const MatchSignal& signal, std::vector<std::string> ids) {
  auto got = signal.contact_ids;
  std::sort(got.begin(), got.end());
  std::sort(ids.begin(), ids.end());
  return got == ids;
}

void TestEmailDuplicatesAreCaseInsensitive() {
  auto c1 = MakeContact("c1", "John", "Doe");
  auto c2 = MakeContact("c2", "John", "Doe");
  auto c3 = MakeContact("c3", "Jane", "Roe");
  AddEmail(c1, "a@x.com");
  AddEmail(c1, "A@X.com");
  AddEmail(c2, "A@x.COM");
  AddEmail(c3, "j@x.com");

  const auto signals = FindEmailDuplicates({c1, c2, c3});
  assert(signals.size() == 1);
  assert(signals[0].type == MatchType::kEmail);
  assert(signals[0].match_value == "a@x.com");
  assert(signals[0].contact_ids == std::vector<std::string>({"c1", "c2"}));
}

void TestPhoneDuplicatesUseNormalizedDigits() {
  auto c1 = MakeContact("c1", "A", "B");
  auto c2 = MakeContact("c2", "C", "D");
  auto c3 = MakeContact("c3", "E", "F");
  AddPhone(c1, "(555) 123-4567");
  AddPhone(c2, "+1 555-123-4567");
  AddPhone(c3, "n/a");

  const auto signals = FindPhoneDuplicates({c1, c2, c3});
  assert(signals.size() == 1);
  assert(signals[0].match_value == "5551234567");
  assert(SameIds(signals[0], {"c1", "c2"}));
}

void TestReorderedNamesMatchByFingerprintOnly() {
  const ContactSnapshot contacts = {MakeContact("c1", "Tom", "Cruise", "Actor"), MakeContact("c2", "Cruise", "Tom", "Producer")};

  const auto fingerprint = FindFingerprintNameDuplicates(contacts);
  assert(fingerprint.size() == 1);
  assert(fingerprint[0].type == MatchType::kFingerprintName);
  assert(SameIds(fingerprint[0], {"c1", "c2"}));
  assert(fingerprint[0].match_value == "cruise tom (Tom Cruise, Cruise Tom)");

  assert(FindNameTitleDuplicates(contacts).empty());
}

void TestNameTitleDuplicates() {
  const ContactSnapshot contacts = {MakeContact("c1", "Ann", "Lee", "CTO"), MakeContact("c2", " ann ", "LEE", "cto"),
                                    MakeContact("c3", "Ann", "Lee", "CEO"), MakeContact("c4", "Ann", "Lee")};

  const auto signals = FindNameTitleDuplicates(contacts);
  assert(signals.size() == 1);
  assert(signals[0].match_value == "ann lee | cto");
  assert(SameIds(signals[0], {"c1", "c2"}));
}

void TestFuzzyNameThreshold() {
  const ContactSnapshot contacts = {MakeContact("c1", "Jonathan", "Smith"), MakeContact("c2", "Jonathon", "Smith"),
                                    MakeContact("c3", "David", "Smith")};

  const auto signals = FindFuzzyNameDuplicates(contacts, 0.9);
  assert(signals.size() == 1);
  assert(signals[0].type == MatchType::kFuzzyName);
  assert(signals[0].contact_ids == std::vector<std::string>({"c1", "c2"}));
  assert(signals[0].match_value.find("Jonathan Smith <-> Jonathon Smith") == 0);

  assert(FindFuzzyNameDuplicates(contacts, 1.0).empty());
}

void TestFuzzyNameSkipsIncompleteNames() {
  const ContactSnapshot contacts = {MakeContact("c1", "Jonathan", std::nullopt), MakeContact("c2", "Jonathan", ""),
                                    MakeContact("c3", std::nullopt, "Smith")};
  assert(FindFuzzyNameDuplicates(contacts, 0.5).empty());
}

void TestBirthdayNameMatchesMonthDay() {
  auto c1     = MakeContact("c1", "Melissa", "Conklin");
  auto c2     = MakeContact("c2", "Melissa", "Conklin");
  c1.birthday = "2022-02-28";
  c2.birthday = "2023-02-28";

  const auto signals = FindBirthdayNameDuplicates({c1, c2});
  assert(signals.size() == 1);
  assert(signals[0].type == MatchType::kBirthdayName);
  assert(signals[0].match_value == "melissa conklin (birthday: 02-28)");
  assert(SameIds(signals[0], {"c1", "c2"}));
}

void TestBirthdayNameIgnoresPlaceholder() {
  auto c1     = MakeContact("c1", "Melissa", "Conklin");
  auto c2     = MakeContact("c2", "Melissa", "Conklin");
  c1.birthday = "2001-01-01";
  c2.birthday = "2001-01-01";
  assert(FindBirthdayNameDuplicates({c1, c2}).empty());

  // a different placeholder lets the same pair match
  assert(FindBirthdayNameDuplicates({c1, c2}, "1900-01-01").size() == 1);
}

void TestLinkedinDuplicates() {
  auto c1     = MakeContact("c1", "A", "B");
  auto c2     = MakeContact("c2", "C", "D");
  auto c3     = MakeContact("c3", "E", "F");
  c1.linkedin = "https://www.linkedin.com/in/jdoe/";
  c2.linkedin = "jdoe";
  c3.linkedin = "https://example.com/jdoe";

  const auto signals = FindLinkedinDuplicates({c1, c2, c3});
  assert(signals.size() == 1);
  assert(signals[0].match_value == "linkedin.com/in/jdoe");
  assert(SameIds(signals[0], {"c1", "c2"}));
}

void TestFindAllDuplicatesClustersAcrossDetectors() {
  auto c1 = MakeContact("c1", "John", "Doe", "Engineer");
  auto c2 = MakeContact("c2", "Johnny", "Walker");
  auto c3 = MakeContact("c3", "John", "Doe", "Engineer");
  auto c4 = MakeContact("c4", "Zed", "Zulu");
  AddEmail(c1, "j@x.com");
  AddEmail(c2, "J@X.com");

  const auto scan = FindAllDuplicates({c1, c2, c3, c4}, 0.98);
  assert(scan.signals.size() >= 2);
  assert(scan.clusters.size() == 1);
  assert(scan.clusters[0] == std::vector<std::string>({"c1", "c2", "c3"}));
}

void TestDetectorsAreDeterministic() {
  auto c1 = MakeContact("c1", "John", "Doe");
  auto c2 = MakeContact("c2", "John", "Doe");
  AddEmail(c1, "a@x.com");
  AddEmail(c2, "a@x.com");
  AddPhone(c1, "5551234567");
  AddPhone(c2, "555 123 4567");

  const ContactSnapshot contacts = {c1, c2};
  const auto            first    = FindAllDuplicates(contacts, 0.9);
  const auto            second   = FindAllDuplicates(contacts, 0.9);
  assert(first.signals.size() == second.signals.size());
  for (size_t i = 0; i < first.signals.size(); ++i) {
    assert(first.signals[i].type == second.signals[i].type);
    assert(first.signals[i].match_value == second.signals[i].match_value);
    assert(first.signals[i].contact_ids == second.signals[i].contact_ids);
  }
  assert(first.clusters == second.clusters);
}

} // namespace

int main() {
  TestEmailDuplicatesAreCaseInsensitive();
  TestPhoneDuplicatesUseNormalizedDigits();
  TestReorderedNamesMatchByFingerprintOnly();
  TestNameTitleDuplicates();
  TestFuzzyNameThreshold();
  TestFuzzyNameSkipsIncompleteNames();
  TestBirthdayNameMatchesMonthDay();
  TestBirthdayNameIgnoresPlaceholder();
  TestLinkedinDuplicates();
  TestFindAllDuplicatesClustersAcrossDetectors();
  TestDetectorsAreDeterministic();

  std::cout << "dedup_unit_detectors: pass\n";
  return 0;
}
