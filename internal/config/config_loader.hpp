#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace treasury::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing values get defaults:
    server.bind_address -> 0.0.0.0:50051
    database            -> memory
    sqlite.path         -> required when the sqlite backend is chosen
*/
class ConfigLoader {
 public:
  static treasury::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static treasury::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

 private:
  static treasury::runtime::config::RuntimeConfig FromNode(const YAML::Node& node);
};

} // namespace treasury::config
