#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace nutrition::config {

using nutrition::runtime::config::RuntimeConfig;

namespace {

constexpr double kDefaultMaxDirectAmount = 5000;
constexpr double kDefaultMinAmount       = 1;
constexpr double kDefaultCalorieTarget   = 2000;
constexpr double kDefaultProteinTarget   = 50;
constexpr double kDefaultCarbTarget      = 250;
constexpr double kDefaultFatTarget       = 65;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("5000" is a string, 5000 a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.logging().level().empty()) {
    config.mutable_logging()->set_level("info");
  }

  if (config.database().backend_case() == nutrition::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* scaling = config.mutable_scaling();
  if (scaling->max_direct_amount() <= 0) {
    scaling->set_max_direct_amount(kDefaultMaxDirectAmount);
  }
  if (scaling->min_amount() <= 0) {
    scaling->set_min_amount(kDefaultMinAmount);
  }
  if (scaling->min_amount() > scaling->max_direct_amount()) {
    throw std::runtime_error("Invalid configuration: scaling.min_amount exceeds scaling.max_direct_amount");
  }

  auto* targets = config.mutable_targets();
  if (targets->calories() <= 0) targets->set_calories(kDefaultCalorieTarget);
  if (targets->protein() <= 0) targets->set_protein(kDefaultProteinTarget);
  if (targets->carbs() <= 0) targets->set_carbs(kDefaultCarbTarget);
  if (targets->fat() <= 0) targets->set_fat(kDefaultFatTarget);

  auto* backup = config.mutable_backup();
  if (backup->filename_prefix().empty()) {
    backup->set_filename_prefix("CalorieTracker_Backup_");
  }
  if (backup->directory().empty()) {
    backup->set_directory(".");
  }
}

} // namespace nutrition::config
