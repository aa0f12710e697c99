#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace stackctl::config {

using stackctl::runtime::config::ProcessPattern;
using stackctl::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

static void AddPattern(RuntimeConfig& config, const std::string& pattern, const std::string& also_contains, ProcessPattern::Category category) {
  auto* entry = config.mutable_stop()->add_patterns();
  entry->set_pattern(pattern);
  entry->set_also_contains(also_contains);
  entry->set_category(category);
}

static void OverrideFromEnv(const char* name, std::string* target) {
  if (const char* value = std::getenv(name)) {
    if (*value != '\0') {
      *target = value;
    }
  }
}

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

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
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

  return config;
}

RuntimeConfig ConfigLoader::LoadFromEnvironment() {
  RuntimeConfig config;

  if (const char* path = std::getenv("STACKCTL_CONFIG"); path && *path != '\0') {
    config = LoadFromYaml(path);
  } else if (std::filesystem::exists(kDefaultPath)) {
    config = LoadFromYaml(kDefaultPath);
  }

  FillDefaults(config);
  ApplyEnvironment(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  FillDefaults(config);
  return config;
}

void ConfigLoader::FillDefaults(RuntimeConfig& config) {
  auto* stop = config.mutable_stop();
  if (stop->patterns().empty()) {
    AddPattern(config, "next dev", "", ProcessPattern::WEB);
    AddPattern(config, "webapp", "node", ProcessPattern::WEB);
    AddPattern(config, "production_pipeline", "", ProcessPattern::PIPELINE);
    AddPattern(config, "se_letters", "", ProcessPattern::APP);
  }
  if (stop->ports().empty()) {
    stop->add_ports(3000);
    stop->add_ports(3001);
    stop->add_ports(3002);
  }
  if (stop->settle_interval_ms() == 0) {
    stop->set_settle_interval_ms(2000);
  }

  if (config.embedded().path().empty()) {
    config.mutable_embedded()->set_path("data/letters.db");
  }

  auto* server = config.mutable_server();
  if (server->host().empty()) server->set_host("localhost");
  if (server->port() == 0) server->set_port(5432);
  if (server->pg_dump_path().empty()) server->set_pg_dump_path("pg_dump");
  if (server->psql_path().empty()) server->set_psql_path("psql");

  if (config.backup().directory().empty()) {
    config.mutable_backup()->set_directory("data/backups");
  }
  if (config.backup().system_name().empty()) {
    config.mutable_backup()->set_system_name("se_letters");
  }

  if (config.selection().path().empty()) {
    config.mutable_selection()->set_path("data/backend_selection.json");
  }
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  OverrideFromEnv("STACKCTL_DB_PATH", config.mutable_embedded()->mutable_path());
  OverrideFromEnv("STACKCTL_BACKUP_DIR", config.mutable_backup()->mutable_directory());
  OverrideFromEnv("STACKCTL_SELECTION_PATH", config.mutable_selection()->mutable_path());

  auto* server = config.mutable_server();
  OverrideFromEnv("PGHOST", server->mutable_host());
  OverrideFromEnv("PGUSER", server->mutable_user());
  OverrideFromEnv("PGDATABASE", server->mutable_database());

  if (const char* port = std::getenv("PGPORT"); port && *port != '\0') {
    char*      endptr = nullptr;
    const long value  = std::strtol(port, &endptr, 10);
    if (!endptr || *endptr != '\0' || value <= 0 || value > 65535) {
      throw stackctl::util::InvalidConfig("PGPORT is not a valid port: " + std::string(port));
    }
    server->set_port(static_cast<uint32_t>(value));
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  using stackctl::util::InvalidConfig;

  for (const auto& entry : config.stop().patterns()) {
    if (entry.pattern().empty()) {
      throw InvalidConfig("stop.patterns: pattern must not be empty");
    }
  }
  for (auto port : config.stop().ports()) {
    if (port == 0 || port > 65535) {
      throw InvalidConfig("stop.ports: out of range: " + std::to_string(port));
    }
  }
  if (config.embedded().path().empty()) {
    throw InvalidConfig("embedded.path must not be empty");
  }
  if (config.backup().directory().empty()) {
    throw InvalidConfig("backup.directory must not be empty");
  }
  for (char c : config.backup().system_name()) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw InvalidConfig("backup.system_name contains invalid character");
    }
  }
  if (config.selection().path().empty()) {
    throw InvalidConfig("selection.path must not be empty");
  }
}

} // namespace stackctl::config
