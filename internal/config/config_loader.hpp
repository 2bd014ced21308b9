#pragma once

#include <string>

#include "config/config.pb.h"

namespace household::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled from Defaults() and the result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static household::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static household::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(household::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidConfig.
  static void Validate(const household::runtime::config::RuntimeConfig& config);
};

} // namespace household::config
