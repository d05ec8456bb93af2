#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <stdexcept>

namespace waveq::config {

using waveq::runtime::config::RuntimeConfig;

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

void ConfigLoader::YamlToValue(const YAML::Node& node, google::protobuf::Value* value) {
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
        YamlToValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  ConfigLoader::YamlToValue(yaml, &json_value);

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

  auto config = ParseYamlNode(yaml);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address("0.0.0.0:50051");
  }

  if (config->server().max_message_bytes() == 0) {
    config->mutable_server()->set_max_message_bytes(64u * 1024u * 1024u);
  }

  if (config->database().backend_case() == waveq::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_memory();
  }

  if (config->storage().backend_case() == waveq::runtime::config::StorageConfig::BACKEND_NOT_SET) {
    config->mutable_storage()->mutable_ram();
  }

  if (config->workers().threads() == 0) {
    config->mutable_workers()->set_threads(2);
  }

  if (config->scheduler().default_priority() == 0) {
    config->mutable_scheduler()->set_default_priority(3);
  }

  auto* execution = config->mutable_execution();
  if (execution->max_attempts() == 0) execution->set_max_attempts(3);
  if (execution->retry_backoff_ms() == 0) execution->set_retry_backoff_ms(100);
  if (execution->max_abandoned_attempts() == 0) execution->set_max_abandoned_attempts(8);

  if (config->status().publish_attempts() == 0) {
    config->mutable_status()->set_publish_attempts(3);
  }
  if (!config->status().has_progress_events()) {
    config->mutable_status()->set_progress_events(true);
  }

  if (config->database().has_sqlite() && !config->database().sqlite().has_wal_mode()) {
    config->mutable_database()->mutable_sqlite()->set_wal_mode(true);
  }

  if (config->intake().topic().empty()) {
    config->mutable_intake()->set_topic("audio/edit");
  }

  if (config->observability().service_name().empty()) {
    config->mutable_observability()->set_service_name("waveq-engine");
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto default_priority = config.scheduler().default_priority();
  if (default_priority < 1 || default_priority > 5) {
    throw std::invalid_argument("scheduler.default_priority must be within 1..5");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path is required");
  }

  if (config.storage().has_disk() && config.storage().disk().root_path().empty()) {
    throw std::invalid_argument("storage.disk.root_path is required");
  }

  if (config.workers().threads() > 256) {
    throw std::invalid_argument("workers.threads must be at most 256");
  }

  if (config.observability().has_trace_sample_ratio()) {
    const auto ratio = config.observability().trace_sample_ratio();
    if (!(ratio > 0.0 && ratio <= 1.0)) {
      throw std::invalid_argument("observability.trace_sample_ratio must be within (0, 1]");
    }
  }
}

} // namespace waveq::config
