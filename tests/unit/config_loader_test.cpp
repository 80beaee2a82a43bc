#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "contact_dedup_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsRuntimeError(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: /var/lib/contacts.db
    busy_timeout_ms: 250
logging:
  level: debug
sync:
  source_path: contacts.json
  page_size: 50
  max_concurrency: 3
  chunk_multiplier: 4
dedup:
  fuzzy_threshold: 0.97
  report_fuzzy_threshold: 0.9
  placeholder_birthday: "1900-01-01"
  default_phone_region: GB
  report_path: out.md
)");

  auto config = dedup::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/contacts.db");
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.logging().level() == "debug");
  assert(config.sync().page_size() == 50);
  assert(config.sync().max_concurrency() == 3);
  assert(config.sync().chunk_multiplier() == 4);
  assert(config.dedup().fuzzy_threshold() == 0.97);
  assert(config.dedup().placeholder_birthday() == "1900-01-01");
  assert(config.dedup().default_phone_region() == "GB");
}

void TestDefaultsFillMissingValues() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(database:
  sqlite:
    path: contacts.db
)");

  auto config = dedup::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.sync().page_size() == 100);
  assert(config.sync().max_concurrency() == 5);
  assert(config.sync().chunk_multiplier() == 2);
  assert(config.dedup().fuzzy_threshold() == 0.98);
  assert(config.dedup().report_fuzzy_threshold() == 0.95);
  assert(config.dedup().placeholder_birthday() == "2001-01-01");
  assert(config.dedup().default_phone_region() == "US");
  assert(config.dedup().report_path() == "duplicate_analysis_report.md");
}

void TestMemoryBackend() {
  const auto yaml_path = WriteYaml("memory",
                                   R"(database:
  memory: {}
)");

  auto config = dedup::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\contacts\\\"quoted\"\\db.sqlite"
)");

  auto config = dedup::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\contacts\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(database:
  sqlite:
    path: "12345"
dedup:
  report_path: "line1\nline2☃"
)");

  auto config = dedup::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "12345");
  assert(config.dedup().report_path() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  sqlite:
    path: contacts.db
unknown_field: 123
)");

  assert(ThrowsRuntimeError([&] { (void)dedup::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }) &&
         "ConfigLoader must reject unknown fields.");
}

void TestThresholdsOutOfRangeAreRejected() {
  const auto yaml_path = WriteYaml("bad_threshold",
                                   R"(dedup:
  fuzzy_threshold: 1.5
)");

  assert(ThrowsRuntimeError([&] { (void)dedup::config::ConfigLoader::LoadFromYaml(yaml_path.string()); }));
}

void TestMissingFileIsRejected() {
  assert(ThrowsRuntimeError([] { (void)dedup::config::ConfigLoader::LoadFromYaml("/nonexistent/contact-dedup.yaml"); }));
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsFillMissingValues();
  TestMemoryBackend();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestThresholdsOutOfRangeAreRejected();
  TestMissingFileIsRejected();

  std::cout << "dedup_unit_config_loader: pass\n";
  return 0;
}
