#pragma once

#include <string>

#include "config/config.pb.h"

namespace eryzaa::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left empty or
  zero are filled from the built-in defaults afterwards.
*/
class ConfigLoader {
 public:
  static eryzaa::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(eryzaa::runtime::config::RuntimeConfig& config);
};

} // namespace eryzaa::config
