#pragma once

#include <yaml-cpp/yaml.h>

#include <string>

#include "config/config.pb.h"

namespace google::protobuf {
class Value;
}

namespace waveq::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Unset fields are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static waveq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static waveq::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Fills every zero-valued knob with its default.
  static void ApplyDefaults(waveq::runtime::config::RuntimeConfig* config);

  // Throws std::invalid_argument on values outside their range.
  static void Validate(const waveq::runtime::config::RuntimeConfig& config);

  // Scalar detection: true/false -> bool, numeric -> number, else string.
  static void YamlToValue(const YAML::Node& node, google::protobuf::Value* value);
};

} // namespace waveq::config
