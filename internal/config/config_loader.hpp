#pragma once

#include <string>

#include "config/config.pb.h"

namespace bibmirror::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Defaults are applied to unset fields before validation.
*/
class ConfigLoader {
 public:
  static bibmirror::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills zero-valued fields with their defaults.
  static void ApplyDefaults(bibmirror::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the offending field.
  static void Validate(const bibmirror::runtime::config::RuntimeConfig& config);
};

} // namespace bibmirror::config
