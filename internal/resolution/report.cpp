#include "report.hpp"

#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "internal/util/strings.hpp"

namespace dedup::resolution {

namespace {

struct Section {
  std::string              heading;
  const char*              title;
  const char*              empty_text;
  std::vector<MatchSignal> signals;
};

struct Level {
  std::string          heading;
  std::vector<Section> sections;
};

std::string DisplayName(const db::model::ContactRecord& contact) {
  return util::Trim(contact.first_name.value_or("") + " " + contact.last_name.value_or(""));
}

void WriteGroup(std::ostringstream& out, const std::map<std::string, const db::model::ContactRecord*>& by_id, const MatchSignal& signal,
                const char* title) {
  out << "### " << title << ": `" << signal.match_value << "`\n";
  out << "| ID | Name | Job Title |\n";
  out << "|---|---|---|\n";
  for (const auto& id : signal.contact_ids) {
    auto it = by_id.find(id);
    if (it == by_id.end()) {
      out << "| `" << id << "` | Unknown | N/A |\n";
      continue;
    }
    const auto& contact = *it->second;
    const auto  job     = contact.job_title.value_or("");
    out << "| `" << id << "` | " << DisplayName(contact) << " | " << (job.empty() ? "N/A" : job) << " |\n";
  }
  out << "\n";
}

} // namespace

DuplicateReport BuildDuplicateReport(const ContactSnapshot& contacts, const ReportOptions& options) {
  std::map<std::string, const db::model::ContactRecord*> by_id;
  for (const auto& contact : contacts) by_id[contact.id] = &contact;

  std::ostringstream fuzzy_heading;
  fuzzy_heading << "### Fuzzy Name Matches (Jaro-Winkler >= " << options.fuzzy_threshold << ")";
  const auto fuzzy_heading_text = fuzzy_heading.str();

  std::vector<Level> levels(4);
  levels[0].heading = "## Level 1: Exact Matches (Highest Confidence)";
  levels[0].sections.push_back(
      Section{"### Shared Emails", "Email", "_No shared emails found._", FindEmailDuplicates(contacts)});
  levels[0].sections.push_back(
      Section{"### Shared Phones", "Phone", "_No shared phone numbers found._", FindPhoneDuplicates(contacts)});
  levels[0].sections.push_back(Section{"### Shared LinkedIn Profiles", "LinkedIn", "_No shared LinkedIn profiles found._",
                                       FindLinkedinDuplicates(contacts)});

  levels[1].heading = "## Level 1.5: Name + Birthday (High Confidence)";
  levels[1].sections.push_back(Section{"### Same Name and Birthday", "Birthday", "_No name + birthday duplicates found._",
                                       FindBirthdayNameDuplicates(contacts, options.placeholder_birthday)});
  levels[1].sections.push_back(Section{"### Same Name Fingerprint", "Fingerprint", "_No name fingerprint duplicates found._",
                                       FindFingerprintNameDuplicates(contacts)});

  levels[2].heading = "## Level 2: Rule-Based Matches (Medium Confidence)";
  levels[2].sections.push_back(Section{"### Shared Name + Job Title", "Match", "_No Name + Job Title duplicates found._",
                                       FindNameTitleDuplicates(contacts)});

  levels[3].heading = "## Level 3: Fuzzy Matches (Lower Confidence)";
  levels[3].sections.push_back(Section{fuzzy_heading_text, "Fuzzy Match", "_No fuzzy name duplicates found._",
                                       FindFuzzyNameDuplicates(contacts, options.fuzzy_threshold)});

  DuplicateReport       report;
  std::set<std::string> flagged;
  for (const auto& level : levels) {
    for (const auto& section : level.sections) {
      report.signal_count += section.signals.size();
      for (const auto& signal : section.signals) flagged.insert(signal.contact_ids.begin(), signal.contact_ids.end());
    }
  }
  report.flagged_contacts = flagged.size();

  std::ostringstream out;
  out << "# Comprehensive Duplicate Contact Report\n\n";
  if (!options.source_label.empty()) out << "**Database:** `" << options.source_label << "`\n";
  out << "**Total Flagged Contacts:** " << report.flagged_contacts << "\n\n";

  for (const auto& level : levels) {
    out << level.heading << "\n";
    for (const auto& section : level.sections) {
      out << section.heading << "\n";
      if (section.signals.empty()) out << section.empty_text << "\n";
      for (const auto& signal : section.signals) WriteGroup(out, by_id, signal, section.title);
    }
  }

  report.markdown = out.str();
  return report;
}

} // namespace dedup::resolution
