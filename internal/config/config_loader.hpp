#pragma once

#include <string>

#include "config/config.pb.h"

namespace renter::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are an
  error. Quoted scalars are always strings, so currency amounts and other
  digit strings should be quoted.
*/
class ConfigLoader {
 public:
  static renter::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static renter::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace renter::config
