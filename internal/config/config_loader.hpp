#pragma once

#include <string>

#include "config/config.pb.h"

namespace rulebook::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset numeric
  fields receive their defaults, secrets may be overridden from the
  environment, and the result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static rulebook::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(rulebook::runtime::config::RuntimeConfig& config);
  static void ApplyEnvironment(rulebook::runtime::config::RuntimeConfig& config);
  static void Validate(const rulebook::runtime::config::RuntimeConfig& config);
};

} // namespace rulebook::config
