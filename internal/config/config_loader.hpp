#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/model/experiment.hpp"

namespace trajectory::config {

/*
  Loads RuntimeConfig from YAML.

  The YAML tree is rendered as JSON text and parsed into the protobuf
  schema, so unknown keys and mistyped values are rejected. Quoted scalars
  stay strings, so prompts such as "42" survive; unquoted integers keep
  full 64-bit precision. An empty document yields default settings.
  All failures throw util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static trajectory::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static trajectory::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Validated experiment section.
  static model::ExperimentConfig ToExperiment(const trajectory::runtime::config::RuntimeConfig& config);
};

} // namespace trajectory::config
