#pragma once

#include <cstddef>
#include <string>

#include "internal/resolution/detectors.hpp"

namespace dedup::resolution {

struct ReportOptions {
  std::string source_label; // shown in the header, e.g. the database path
  double      fuzzy_threshold      = 0.95;
  std::string placeholder_birthday = kPlaceholderBirthday;
};

struct DuplicateReport {
  std::string markdown;
  std::size_t flagged_contacts = 0; // distinct ids across all signals
  std::size_t signal_count     = 0;
};

// Runs every detector and renders the findings as Markdown, grouped by
// confidence level.
DuplicateReport BuildDuplicateReport(const ContactSnapshot& contacts, const ReportOptions& options);

} // namespace dedup::resolution
