#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace bibmirror::config {

namespace {

constexpr uint64_t    kDefaultLowDiskSpaceThreshold = 100ull * 1024 * 1024;
constexpr uint32_t    kDefaultImportCheckpoint      = 1000;
constexpr uint32_t    kDefaultSyncCheckpoint        = 100;
constexpr uint32_t    kDefaultProgressIntervalMs    = 100;
constexpr uint32_t    kDefaultBatchSize             = 1000;
constexpr uint32_t    kDefaultTimeoutSeconds        = 60;
constexpr const char* kDefaultUserAgent             = "bibmirror";

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are tagged "!" and stay strings
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

// ------------------------------------------------------------
// Defaults / validation
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(bibmirror::runtime::config::RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  if (config.database().backend_case() == bibmirror::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* ingest = config.mutable_ingest();
  if (ingest->low_disk_space_threshold_bytes() == 0) ingest->set_low_disk_space_threshold_bytes(kDefaultLowDiskSpaceThreshold);
  if (ingest->import_checkpoint_interval() == 0) ingest->set_import_checkpoint_interval(kDefaultImportCheckpoint);
  if (ingest->sync_checkpoint_interval() == 0) ingest->set_sync_checkpoint_interval(kDefaultSyncCheckpoint);
  if (ingest->progress_interval_ms() == 0) ingest->set_progress_interval_ms(kDefaultProgressIntervalMs);

  auto* sync = config.mutable_sync();
  if (sync->batch_size() == 0) sync->set_batch_size(kDefaultBatchSize);
  if (sync->timeout_seconds() == 0) sync->set_timeout_seconds(kDefaultTimeoutSeconds);
  if (sync->user_agent().empty()) sync->set_user_agent(kDefaultUserAgent);
}

void ConfigLoader::Validate(const bibmirror::runtime::config::RuntimeConfig& config) {
  if (spdlog::level::from_str(config.logging().level()) == spdlog::level::off && config.logging().level() != "off") {
    throw std::runtime_error("Invalid configuration: logging.level '" + config.logging().level() + "' is not a log level");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  if (config.ingest().import_checkpoint_interval() == 0) {
    throw std::runtime_error("Invalid configuration: ingest.import_checkpoint_interval must be positive");
  }
  if (config.ingest().sync_checkpoint_interval() == 0) {
    throw std::runtime_error("Invalid configuration: ingest.sync_checkpoint_interval must be positive");
  }

  const auto& sync = config.sync();
  for (const auto* url : {&sync.non_fiction_url(), &sync.fiction_url(), &sync.scimag_url()}) {
    if (!url->empty() && url->find("{timenewer}") == std::string::npos) {
      throw std::runtime_error("Invalid configuration: sync url '" + *url + "' lacks a {timenewer} placeholder");
    }
  }
  if (sync.batch_size() == 0) {
    throw std::runtime_error("Invalid configuration: sync.batch_size must be positive");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

bibmirror::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  bibmirror::runtime::config::RuntimeConfig config;

  // an empty document yields all defaults
  if (!yaml.IsNull()) {
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
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace bibmirror::config
