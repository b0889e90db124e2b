#pragma once

#include <string>

#include "config/config.pb.h"

namespace pwaudit::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the .proto schema
  is the single source of truth for accepted keys. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static pwaudit::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static pwaudit::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace pwaudit::config
