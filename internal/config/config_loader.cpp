#include "config_loader.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "internal/util/errors.hpp"

namespace trajectory::config {

namespace {

void AppendJsonString(std::string& out, const std::string& text) {
  out.push_back('"');
  for (unsigned char c : text) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char escaped[8];
          std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
          out += escaped;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

// Integers are copied digit for digit so 64-bit seeds keep full precision.
bool AppendJsonNumber(std::string& out, const std::string& scalar) {
  if (scalar.empty()) {
    return false;
  }

  char* end = nullptr;
  errno     = 0;
  const long long integer = std::strtoll(scalar.c_str(), &end, 10);
  if (*end == '\0' && errno == 0) {
    out += std::to_string(integer);
    return true;
  }

  end = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (*end != '\0' || !std::isfinite(number)) {
    return false;
  }
  std::ostringstream formatted;
  formatted.precision(17);
  formatted << number;
  out += formatted.str();
  return true;
}

void AppendScalar(std::string& out, const YAML::Node& node) {
  const std::string& scalar = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and always stay strings
  if (node.Tag() == "!") {
    AppendJsonString(out, scalar);
    return;
  }
  if (scalar == "true" || scalar == "false") {
    out += scalar;
    return;
  }
  if (!AppendJsonNumber(out, scalar)) {
    AppendJsonString(out, scalar);
  }
}

void AppendJson(std::string& out, const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      out += "null";
      return;

    case YAML::NodeType::Scalar:
      AppendScalar(out, node);
      return;

    case YAML::NodeType::Sequence: {
      out.push_back('[');
      for (std::size_t i = 0; i < node.size(); ++i) {
        if (i > 0) out.push_back(',');
        AppendJson(out, node[i]);
      }
      out.push_back(']');
      return;
    }

    case YAML::NodeType::Map: {
      out.push_back('{');
      bool first = true;
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw util::InvalidConfig("configuration keys must be scalars");
        }
        if (!first) out.push_back(',');
        first = false;
        AppendJsonString(out, entry.first.Scalar());
        out.push_back(':');
        AppendJson(out, entry.second);
      }
      out.push_back('}');
      return;
    }
  }
  throw util::InvalidConfig("unsupported YAML node");
}

void ValidateRuntime(const trajectory::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw util::InvalidConfig("database.sqlite.path must not be empty");
  }

  for (const auto& [model, pool] : config.orchestrator().pools()) {
    if (pool.capacity() == 0) {
      throw util::InvalidConfig("orchestrator.pools." + model + ".capacity must be positive");
    }
  }

  const auto& analysis = config.analysis();
  if (analysis.max_points() == 1) {
    throw util::InvalidConfig("analysis.max_points must be 0 (default) or at least 2");
  }
}

trajectory::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  trajectory::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::InvalidConfig("configuration root must be a mapping");
  }

  std::string json;
  AppendJson(json, yaml);

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidConfig("invalid configuration: " + std::string(status.message()));
  }

  ValidateRuntime(config);
  return config;
}

} // namespace

trajectory::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig("failed to load YAML config " + path + ": " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

trajectory::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidConfig("failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

model::ExperimentConfig ConfigLoader::ToExperiment(const trajectory::runtime::config::RuntimeConfig& config) {
  if (!config.has_experiment()) {
    throw util::InvalidConfig("configuration has no experiment section");
  }
  const auto& section = config.experiment();

  model::ExperimentConfig experiment;
  for (const auto& network : section.networks()) {
    experiment.networks.emplace_back(network.models().begin(), network.models().end());
  }
  experiment.seeds.assign(section.seeds().begin(), section.seeds().end());
  experiment.prompts.assign(section.prompts().begin(), section.prompts().end());
  experiment.embedding_models.assign(section.embedding_models().begin(), section.embedding_models().end());
  experiment.run_length = section.run_length();

  experiment.Validate();
  return experiment;
}

} // namespace trajectory::config
