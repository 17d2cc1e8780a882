#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace orchestrator::config {

using namespace orchestrator::runtime::config;

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
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      // `memory:` with nothing under it selects the backend
      value->mutable_struct_value();
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

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
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
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50071");

  auto* store = config.mutable_store();
  if (store->backend_case() == StoreConfig::BACKEND_NOT_SET) store->mutable_memory();
  if (store->retry_attempts() == 0) store->set_retry_attempts(3);
  if (store->retry_backoff_ms() == 0) store->set_retry_backoff_ms(50);
  if (store->session_ttl_ms() == 0) store->set_session_ttl_ms(15000);

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->source_case() == SchedulerConfig::SOURCE_NOT_SET) scheduler->mutable_labels();
  if (scheduler->has_http() && scheduler->http().timeout_ms() == 0) scheduler->mutable_http()->set_timeout_ms(5000);

  auto* reconcile = config.mutable_reconcile();
  if (reconcile->fallback_tick_ms() == 0) reconcile->set_fallback_tick_ms(1000);
  if (reconcile->watch_slice_ms() == 0) reconcile->set_watch_slice_ms(250);
  if (reconcile->farm_poll_ms() == 0) reconcile->set_farm_poll_ms(1000);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& store = config.store();
  if (store.has_sqlite() && store.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: store.sqlite.path is required");
  }
  if (store.retry_attempts() > 100) {
    throw std::runtime_error("Invalid configuration: store.retry_attempts must be <= 100");
  }
  if (store.session_ttl_ms() < 1000) {
    throw std::runtime_error("Invalid configuration: store.session_ttl_ms must be >= 1000");
  }

  const auto& scheduler = config.scheduler();
  if (scheduler.has_http() && scheduler.http().endpoint().empty()) {
    throw std::runtime_error("Invalid configuration: scheduler.http.endpoint is required");
  }

  const auto& reconcile = config.reconcile();
  if (reconcile.watch_slice_ms() > reconcile.fallback_tick_ms()) {
    throw std::runtime_error("Invalid configuration: reconcile.watch_slice_ms must not exceed reconcile.fallback_tick_ms");
  }
  if (reconcile.farm_poll_ms() * 2 >= store.session_ttl_ms()) {
    throw std::runtime_error("Invalid configuration: reconcile.farm_poll_ms must be under half of store.session_ttl_ms");
  }
}

} // namespace orchestrator::config
