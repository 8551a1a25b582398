#pragma once

#include <string>

#include "config/config.pb.h"

namespace millsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static millsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace millsync::config
