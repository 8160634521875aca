#pragma once

#include <string>

#include "config/config.pb.h"

namespace doccache::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static doccache::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static doccache::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace doccache::config
