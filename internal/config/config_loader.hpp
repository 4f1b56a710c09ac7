#pragma once

#include <string>

#include "config/config.pb.h"

namespace tables::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected, and a sqlite backend must name its database file.
*/
class ConfigLoader {
 public:
  static tables::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tables::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace tables::config
