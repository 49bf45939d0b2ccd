#pragma once

#include <string>

#include "config/config.pb.h"

namespace catalog::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. The result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static catalog::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error("Invalid configuration: ...").
  static void Validate(const catalog::runtime::config::RuntimeConfig& config);
};

} // namespace catalog::config
