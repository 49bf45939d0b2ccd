#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace catalog::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

static bool IsKnownLogLevel(std::string_view level) {
  for (std::string_view known : {"trace", "debug", "info", "warning", "warn", "error", "err", "critical", "off"}) {
    if (level == known) return true;
  }
  return false;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

catalog::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  catalog::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const catalog::runtime::config::RuntimeConfig& config) {
  const auto& level = config.logging().level();
  if (!level.empty() && !IsKnownLogLevel(level)) {
    throw std::runtime_error("Invalid configuration: unknown logging.level '" + level + "'");
  }

  const auto& database = config.database();
  switch (database.backend_case()) {
    case catalog::runtime::config::DatabaseConfig::kMemory:
      break;

    case catalog::runtime::config::DatabaseConfig::kSqlite:
      // the store opens a writer and a reader connection on the same file
      if (database.sqlite().path().empty() || database.sqlite().path() == ":memory:") {
        throw std::runtime_error("Invalid configuration: database.sqlite.path must name a file");
      }
      break;

    case catalog::runtime::config::DatabaseConfig::kPostgres:
      if (database.postgres().connection_uri().empty()) {
        throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
      }
      break;

    case catalog::runtime::config::DatabaseConfig::BACKEND_NOT_SET:
      throw std::runtime_error("Invalid configuration: database backend is not set");
  }
}

} // namespace catalog::config
