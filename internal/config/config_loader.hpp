#pragma once

#include <string>

#include "vault/config/v1/config.pb.h"

namespace vault::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Missing sections
  fall back to Defaults(); the merged result is validated before it is
  returned.
*/
class ConfigLoader {
 public:
  static vault::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Complete in-memory configuration.
  static vault::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(vault::runtime::config::RuntimeConfig& config);

  // Throws util::ValidationError.
  static void Validate(const vault::runtime::config::RuntimeConfig& config);
};

} // namespace vault::config
