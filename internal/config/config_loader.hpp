#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledcast::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Load() then applies LEDCAST_* environment overrides, fills
  defaults and validates. Every failure is a util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static ledcast::runtime::config::RuntimeConfig Load(const std::string& path);

  static ledcast::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyEnvironmentOverrides(ledcast::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(ledcast::runtime::config::RuntimeConfig& config);
  static void Validate(const ledcast::runtime::config::RuntimeConfig& config);
};

} // namespace ledcast::config
