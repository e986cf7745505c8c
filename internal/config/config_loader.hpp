#pragma once

#include <string>

#include "config/config.pb.h"

namespace mc3d::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset values are filled in by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static mc3d::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config used when no --config file is given.
  static mc3d::runtime::config::RuntimeConfig Default();

  // Standalone matcher settings file: top-level ltol/stol/angle_tol/... keys.
  static mc3d::runtime::config::MatcherConfig LoadMatcherSettings(const std::string& path);

  static void ApplyDefaults(mc3d::runtime::config::RuntimeConfig* config);
  static void ApplyDefaults(mc3d::runtime::config::MatcherConfig* matcher);
};

} // namespace mc3d::config
