#pragma once

#include <string>

#include "config/config.pb.h"

namespace muse::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. MUSE_DB_PATH and MUSE_GENERATION_ENDPOINT override the
  database path and generation endpoint after parsing.
*/
class ConfigLoader {
 public:
  static muse::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static muse::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace muse::config
