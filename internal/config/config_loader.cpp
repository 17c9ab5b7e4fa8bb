#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace rulebook::config {

using rulebook::runtime::config::QUEUE_BACKEND_MEMORY;
using rulebook::runtime::config::QUEUE_BACKEND_POSTGRES;
using rulebook::runtime::config::QUEUE_BACKEND_SQLITE;
using rulebook::runtime::config::QUEUE_BACKEND_UNSPECIFIED;
using rulebook::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("0.0.0.0:50051", "1536")
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
// Defaults / environment / validation
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50051");
  }

  if (config.database().has_sqlite() && !config.database().sqlite().has_wal_mode()) {
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  }

  if (config.database().has_postgres() && config.database().postgres().pool_size() == 0) {
    config.mutable_database()->mutable_postgres()->set_pool_size(8);
  }

  auto* queue = config.mutable_queue();
  if (queue->backend() == QUEUE_BACKEND_UNSPECIFIED) {
    queue->set_backend(QUEUE_BACKEND_MEMORY);
  }
  if (queue->list_name().empty()) queue->set_list_name("image_processing_queue");
  if (queue->job_ttl_sec() == 0) queue->set_job_ttl_sec(24 * 60 * 60);
  if (queue->dequeue_timeout_ms() == 0) queue->set_dequeue_timeout_ms(30000);
  if (queue->default_max_retries() == 0) queue->set_default_max_retries(3);
  if (queue->reconnect_backoff_ms() == 0) queue->set_reconnect_backoff_ms(1000);

  auto* ai = config.mutable_ai();
  // extraction methods are on unless switched off explicitly
  if (!ai->has_enable_ocr()) ai->set_enable_ocr(true);
  if (!ai->has_enable_description()) ai->set_enable_description(true);
  if (!ai->has_enable_labels()) ai->set_enable_labels(true);
  if (ai->embedding_dimensions() == 0) ai->set_embedding_dimensions(1536);
  if (ai->request_timeout_sec() == 0) ai->set_request_timeout_sec(60);
  if (ai->ocr_prompt().empty()) {
    ai->set_ocr_prompt("Extract all text visible in this board game rulebook page. Preserve reading order and section headings. Return plain text only.");
  }
  if (ai->description_prompt().empty()) {
    ai->set_description_prompt(
        "Describe the visual elements of this board game rulebook page: components, diagrams, icons, and example setups. Be factual and concise.");
  }
  if (ai->labeling_prompt().empty()) {
    ai->set_labeling_prompt(
        "Label this board game rulebook page. Answer with a JSON object with keys searchable_text (string), game_elements, key_concepts and "
        "game_actions (arrays of strings).");
  }

  if (config.workers().threads() == 0) config.mutable_workers()->set_threads(1);
  if (config.batch().max_retries() == 0) config.mutable_batch()->set_max_retries(3);

  auto* reconciliation = config.mutable_reconciliation();
  if (!reconciliation->has_enabled()) reconciliation->set_enabled(true);
  if (reconciliation->interval_sec() == 0) reconciliation->set_interval_sec(300);
  if (reconciliation->orphan_age_sec() == 0) reconciliation->set_orphan_age_sec(900);
  if (reconciliation->max_images_per_sweep() == 0) reconciliation->set_max_images_per_sweep(500);
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  if (const char* api_key = std::getenv("RULEBOOK_AI_API_KEY")) {
    config.mutable_ai()->set_api_key(api_key);
  }
  if (const char* uri = std::getenv("RULEBOOK_DATABASE_URI")) {
    if (config.database().has_postgres()) {
      config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
    }
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.ai().embedding_dimensions() == 0) {
    throw std::runtime_error("Invalid configuration: ai.embedding_dimensions must be > 0");
  }
  if (config.workers().threads() == 0) {
    throw std::runtime_error("Invalid configuration: workers.threads must be >= 1");
  }
  if (config.queue().job_ttl_sec() == 0) {
    throw std::runtime_error("Invalid configuration: queue.job_ttl_sec must be > 0");
  }
  if (config.queue().backend() == QUEUE_BACKEND_SQLITE && config.queue().sqlite_path().empty()) {
    throw std::runtime_error("Invalid configuration: queue.sqlite_path is required for the sqlite queue backend");
  }
  if (config.queue().backend() == QUEUE_BACKEND_POSTGRES && config.queue().postgres_uri().empty()) {
    throw std::runtime_error("Invalid configuration: queue.postgres_uri is required for the postgres queue backend");
  }
  if (config.object_store().root_uri().empty()) {
    throw std::runtime_error("Invalid configuration: object_store.root_uri is required");
  }
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must not be empty");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri must not be empty");
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

  ApplyDefaults(config);
  ApplyEnvironment(config);
  Validate(config);

  return config;
}

} // namespace rulebook::config
