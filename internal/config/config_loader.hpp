#pragma once

#include <string>

#include "config/config.pb.h"

namespace registry::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static registry::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace registry::config
