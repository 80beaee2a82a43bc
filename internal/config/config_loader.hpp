#pragma once

#include <string>

#include "config/config.pb.h"

namespace dedup::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected; zero values are replaced by defaults.
*/
class ConfigLoader {
 public:
  static dedup::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fill unset sync/dedup tunables with their defaults.
  static void ApplyDefaults(dedup::runtime::config::RuntimeConfig& config);
};

} // namespace dedup::config
