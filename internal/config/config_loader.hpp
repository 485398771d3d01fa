#pragma once

#include <string>

#include "config/config.pb.h"

namespace streamledger::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected, so a misspelled key fails at startup instead of being ignored.
*/
class ConfigLoader {
 public:
  static streamledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static streamledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace streamledger::config
