#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace tally::config {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

// Raised while walking the document; `where` is the dotted key path.
class YamlShapeError : public std::runtime_error {
 public:
  YamlShapeError(const std::string& where, const std::string& what) : std::runtime_error(where + ": " + what) {
  }
};

std::string Child(const std::string& where, const std::string& key) {
  return where.empty() ? key : where + "." + key;
}

bool IsQuoted(const YAML::Node& node) {
  // yaml-cpp tags plain scalars "?" and quoted ones "!"
  return node.Tag() == "!";
}

// Plain scalars follow the YAML core schema; quoted ones are always text
// so a path such as "2024" or a level of "true" survives as written.
void ScalarToValue(const YAML::Node& node, Value* value) {
  const auto& text = node.Scalar();

  if (!IsQuoted(node)) {
    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;
    }
    if (text == "true" || text == "True" || text == "TRUE") {
      value->set_bool_value(true);
      return;
    }
    if (text == "false" || text == "False" || text == "FALSE") {
      value->set_bool_value(false);
      return;
    }
    if (!text.empty()) {
      char*        end    = nullptr;
      const double number = std::strtod(text.c_str(), &end);
      if (end != nullptr && *end == '\0' && std::isfinite(number)) {
        value->set_number_value(number);
        return;
      }
    }
  }

  value->set_string_value(text);
}

void NodeToValue(const YAML::Node& node, const std::string& where, Value* value);

void MapToStruct(const YAML::Node& node, const std::string& where, Struct* out) {
  for (const auto& entry : node) {
    if (!entry.first.IsScalar()) throw YamlShapeError(where.empty() ? "<root>" : where, "keys must be plain strings");

    const auto& key = entry.first.Scalar();
    NodeToValue(entry.second, Child(where, key), &(*out->mutable_fields())[key]);
  }
}

void NodeToValue(const YAML::Node& node, const std::string& where, Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null: value->set_null_value(google::protobuf::NULL_VALUE); return;

    case YAML::NodeType::Scalar: ScalarToValue(node, value); return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        NodeToValue(node[i], where + "[" + std::to_string(i) + "]", list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: MapToStruct(node, where, value->mutable_struct_value()); return;
  }
  throw YamlShapeError(where, "unsupported YAML node");
}

tally::runtime::config::RuntimeConfig ParseDocument(const YAML::Node& root, const std::string& source) {
  tally::runtime::config::RuntimeConfig config;

  // an empty file is a valid, all-defaults config
  if (root.IsNull()) return config;
  if (!root.IsMap()) throw std::runtime_error("Invalid configuration in " + source + ": top level must be a mapping");

  Struct document;
  try {
    MapToStruct(root, "", &document);
  } catch (const YamlShapeError& e) {
    throw std::runtime_error("Invalid configuration in " + source + ": " + e.what());
  }

  std::string json;
  auto        written = google::protobuf::util::MessageToJsonString(document, &json);
  if (!written.ok()) {
    throw std::runtime_error("Failed to convert " + source + " to JSON: " + std::string(written.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration in " + source + ": " + std::string(parsed.message()));
  }
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

tally::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }

  auto config = ParseDocument(root, path);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(tally::runtime::config::RuntimeConfig& config) {
  if (!config.has_database() || config.database().backend_case() == tally::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (!config.has_remote() || config.remote().backend_case() == tally::runtime::config::RemoteConfig::BACKEND_NOT_SET) {
    config.mutable_remote()->mutable_memory();
  }

  auto* sync = config.mutable_sync();
  if (sync->batch_size() == 0) sync->set_batch_size(kDefaultBatchSize);
  if (sync->max_attempts() == 0) sync->set_max_attempts(kDefaultMaxAttempts);
  if (sync->retry_delays_ms_size() == 0) {
    for (auto delay : kDefaultRetryDelaysMs) sync->add_retry_delays_ms(delay);
  }
  if (sync->poll_interval_ms() == 0) sync->set_poll_interval_ms(kDefaultPollIntervalMs);
  if (sync->sale_lock_wait_ms() == 0) sync->set_sale_lock_wait_ms(kDefaultSaleLockWaitMs);
}

void ConfigLoader::Validate(const tally::runtime::config::RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.remote().has_postgres() && config.remote().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: remote.postgres.connection_uri is required");
  }
}

} // namespace tally::config
