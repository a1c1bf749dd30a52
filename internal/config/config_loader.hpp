#pragma once

#include <string>

#include "config/config.pb.h"

namespace warranty::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Loaded configs are validated before they are returned.
*/
class ConfigLoader {
 public:
  static warranty::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static warranty::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // Throws std::runtime_error naming the first offending key.
  static void Validate(const warranty::runtime::config::RuntimeConfig& config);
};

} // namespace warranty::config
