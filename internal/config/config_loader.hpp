#pragma once

#include <string>

#include "config/config.pb.h"

namespace artifact::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled with defaults and the result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static artifact::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(artifact::runtime::config::RuntimeConfig& config);

  // throws std::runtime_error describing the first problem found
  static void Validate(const artifact::runtime::config::RuntimeConfig& config);
};

} // namespace artifact::config
