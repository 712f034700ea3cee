#pragma once

#include <string>

#include "config/config.pb.h"

namespace vodbridge::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static vodbridge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fill every unset field with its built-in default. Idempotent.
  static void ApplyDefaults(vodbridge::runtime::config::RuntimeConfig* config);

  static vodbridge::runtime::config::RuntimeConfig Defaults();
};

} // namespace vodbridge::config
