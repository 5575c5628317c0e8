#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace streamlift::config {

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

static streamlift::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  streamlift::runtime::config::RuntimeConfig config;

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

streamlift::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

streamlift::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

WorkerSettings ResolveWorkerSettings(const streamlift::runtime::config::RuntimeConfig& config) {
  WorkerSettings settings;
  const auto&    worker = config.worker();

  settings.staging_dir  = worker.staging_dir().empty() ? "/tmp/streamlift" : worker.staging_dir();
  settings.library_root = worker.library_root();
  if (worker.max_concurrent_jobs() > 0) settings.max_concurrent_jobs = worker.max_concurrent_jobs();
  if (worker.concurrent_uploads() > 0) settings.concurrent_uploads = worker.concurrent_uploads();
  if (worker.priority_segments() > 0) settings.priority_segments = worker.priority_segments();
  if (worker.segment_duration_seconds() > 0) settings.segment_duration_seconds = worker.segment_duration_seconds();
  if (worker.status_interval_ms() > 0) settings.status_interval_ms = worker.status_interval_ms();
  if (worker.consumer_threads() > 0) settings.consumer_threads = worker.consumer_threads();
  if (worker.shutdown_grace_ms() > 0) settings.shutdown_grace_ms = worker.shutdown_grace_ms();
  settings.keep_staging = worker.keep_staging();

  if (config.queue().visibility_timeout_ms() > 0) settings.visibility_timeout_ms = config.queue().visibility_timeout_ms();
  if (config.credentials().refresh_margin_ms() > 0) settings.refresh_margin_ms = config.credentials().refresh_margin_ms();
  if (config.subtitles().max_candidates() > 0) settings.max_subtitle_candidates = config.subtitles().max_candidates();

  return settings;
}

} // namespace streamlift::config
