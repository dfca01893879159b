#pragma once

#include <string>

#include "config/config.pb.h"

namespace mapper::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static mapper::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static mapper::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Memory storage, namespace "default", no model directory.
  static mapper::runtime::config::RuntimeConfig Defaults();
};

} // namespace mapper::config
