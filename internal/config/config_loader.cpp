#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <stdexcept>
#include <string>
#include <system_error>

namespace warranty::config {

using warranty::runtime::config::RuntimeConfig;

namespace {

// Plain scalars become bools or numbers when they parse as one; quoted
// scalars ("0042", 'true') always stay strings.
google::protobuf::Value ScalarToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  const std::string&      text = node.Scalar();

  if (node.Tag() != "!") {
    if (text == "true" || text == "false") {
      value.set_bool_value(text == "true");
      return value;
    }
    double number = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (!text.empty() && ec == std::errc() && end == text.data() + text.size()) {
      value.set_number_value(number);
      return value;
    }
  }
  value.set_string_value(text);
  return value;
}

google::protobuf::Value ToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      return value;
    case YAML::NodeType::Scalar:
      return ScalarToValue(node);
    case YAML::NodeType::Sequence:
      for (const auto& item : node) {
        *value.mutable_list_value()->add_values() = ToValue(item);
      }
      return value;
    case YAML::NodeType::Map:
      // `memory: {}` must still select the oneof member.
      value.mutable_struct_value();
      for (const auto& entry : node) {
        (*value.mutable_struct_value()->mutable_fields())[entry.first.Scalar()] = ToValue(entry.second);
      }
      return value;
    default:
      throw std::runtime_error("Invalid configuration: unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
}

} // namespace

static RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  // An empty document is an all-defaults config.
  if (yaml.IsNull()) {
    ConfigLoader::Validate(config);
    return config;
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(ToValue(yaml), &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

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
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  auto fail = [](const std::string& key, const std::string& why) {
    throw std::runtime_error("Invalid configuration: " + key + " " + why);
  };

  const auto& db = config.database();
  if (db.has_sqlite() && db.sqlite().path().empty()) {
    fail("database.sqlite.path", "is required");
  }
  if (db.has_postgres() && db.postgres().connection_uri().empty()) {
    fail("database.postgres.connection_uri", "is required");
  }

  const auto& batch = config.batch();
  if (batch.has_hard_failure_ratio() && (batch.hard_failure_ratio() < 0.0 || batch.hard_failure_ratio() > 1.0)) {
    fail("batch.hard_failure_ratio", "must be within [0, 1]");
  }
  if (config.repair().has_approval_overrun_ratio() && config.repair().approval_overrun_ratio() < 0.0) {
    fail("repair.approval_overrun_ratio", "must not be negative");
  }
  if (config.coverage().has_uncovered_estimated_cost_cents() && config.coverage().uncovered_estimated_cost_cents() < 0) {
    fail("coverage.uncovered_estimated_cost_cents", "must not be negative");
  }

  for (const auto& mime : config.attachments().allowed_mime_types()) {
    if (mime.find('/') == std::string::npos) fail("attachments.allowed_mime_types", "entry '" + mime + "' is not a MIME type");
  }

  for (const auto& product : config.collaborators().products()) {
    if (product.id().empty() || product.sku().empty()) fail("collaborators.products", "entries need id and sku");
  }
  for (const auto& customer : config.collaborators().customers()) {
    if (customer.id().empty()) fail("collaborators.customers", "entries need an id");
  }
}

} // namespace warranty::config
