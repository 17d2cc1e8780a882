#pragma once

#include <string>

#include "config/config.pb.h"

namespace orchestrator::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, unset values get defaults, and the result is validated.
*/
class ConfigLoader {
 public:
  static orchestrator::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static orchestrator::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(orchestrator::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the offending field.
  static void Validate(const orchestrator::runtime::config::RuntimeConfig& config);
};

} // namespace orchestrator::config
