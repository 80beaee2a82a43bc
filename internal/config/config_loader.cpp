#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace dedup::config {

namespace {

constexpr uint32_t kDefaultPageSize         = 100;
constexpr uint32_t kDefaultMaxConcurrency   = 5;
constexpr uint32_t kDefaultChunkMultiplier  = 2;
constexpr double   kDefaultFuzzyThreshold   = 0.98;
constexpr double   kDefaultReportThreshold  = 0.95;
constexpr uint32_t kDefaultBusyTimeoutMs    = 5000;
constexpr const char* kPlaceholderBirthday  = "2001-01-01";
constexpr const char* kDefaultPhoneRegion   = "US";
constexpr const char* kDefaultReportPath    = "duplicate_analysis_report.md";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

dedup::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  dedup::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  const auto& dedup = config.dedup();
  if (dedup.fuzzy_threshold() < 0.0 || dedup.fuzzy_threshold() > 1.0 || dedup.report_fuzzy_threshold() < 0.0 ||
      dedup.report_fuzzy_threshold() > 1.0) {
    throw std::runtime_error("Invalid configuration: fuzzy thresholds must be within [0, 1]");
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(dedup::runtime::config::RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().busy_timeout_ms() == 0) {
    config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  }

  auto* sync = config.mutable_sync();
  if (sync->page_size() == 0) sync->set_page_size(kDefaultPageSize);
  if (sync->max_concurrency() == 0) sync->set_max_concurrency(kDefaultMaxConcurrency);
  if (sync->chunk_multiplier() == 0) sync->set_chunk_multiplier(kDefaultChunkMultiplier);

  auto* dedup = config.mutable_dedup();
  if (dedup->fuzzy_threshold() == 0.0) dedup->set_fuzzy_threshold(kDefaultFuzzyThreshold);
  if (dedup->report_fuzzy_threshold() == 0.0) dedup->set_report_fuzzy_threshold(kDefaultReportThreshold);
  if (dedup->placeholder_birthday().empty()) dedup->set_placeholder_birthday(kPlaceholderBirthday);
  if (dedup->default_phone_region().empty()) dedup->set_default_phone_region(kDefaultPhoneRegion);
  if (dedup->report_path().empty()) dedup->set_report_path(kDefaultReportPath);
}

} // namespace dedup::config
