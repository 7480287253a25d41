#pragma once

#include <string>

#include "config/config.pb.h"

namespace vaultd::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing fields are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static vaultd::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static vaultd::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Config used when no file is given.
  static vaultd::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(vaultd::runtime::config::RuntimeConfig* config);
};

} // namespace vaultd::config
