#pragma once

#include <string>

#include "config/config.pb.h"

namespace stackctl::config {

/*
  Loads RuntimeConfig.

  YAML is converted to JSON then parsed into protobuf. Fields left empty
  in the file take built-in defaults; environment variables override
  both (see ApplyEnvironment).
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultPath = "config/stackctl.yaml";

  static stackctl::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // STACKCTL_CONFIG, else kDefaultPath when present, else built-in defaults.
  static stackctl::runtime::config::RuntimeConfig LoadFromEnvironment();

  static stackctl::runtime::config::RuntimeConfig Defaults();

  static void FillDefaults(stackctl::runtime::config::RuntimeConfig& config);
  static void ApplyEnvironment(stackctl::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidConfig.
  static void Validate(const stackctl::runtime::config::RuntimeConfig& config);
};

} // namespace stackctl::config
