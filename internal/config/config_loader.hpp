#pragma once

#include <string>

#include "config/config.pb.h"

namespace settle::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Every failure throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static settle::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static settle::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Rejects values no settlement run can work with.
  static void Validate(const settle::runtime::config::RuntimeConfig& config);
};

} // namespace settle::config
