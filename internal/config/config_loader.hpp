#pragma once

#include <string>

#include "config/config.pb.h"

namespace nutrition::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Defaults are filled in for every value left unset (or zero).
*/
class ConfigLoader {
 public:
  static nutrition::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static nutrition::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  static nutrition::runtime::config::RuntimeConfig Defaults();
  static void ApplyDefaults(nutrition::runtime::config::RuntimeConfig& config);
};

} // namespace nutrition::config
