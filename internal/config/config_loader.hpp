#pragma once

#include <string>

#include "config/config.pb.h"

namespace syncore::config {

/*
  Loads the agent's RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, printed as JSON and parsed into
  RuntimeConfig with unknown fields rejected. Durations use the protobuf JSON
  form ("30s", "0.5s"). Parse and validation failures raise ValidationError.
*/
class ConfigLoader {
 public:
  static syncore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static syncore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset fields with defaults and rejects inconsistent values.
  static void ApplyDefaults(syncore::runtime::config::RuntimeConfig& config);
  static void Validate(const syncore::runtime::config::RuntimeConfig& config);
};

} // namespace syncore::config
