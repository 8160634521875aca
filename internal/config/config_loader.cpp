#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace doccache::config {

// SQLite's historical SQLITE_MAX_VARIABLE_NUMBER.
static constexpr uint32_t kMaxBatchKeysLimit = 999;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted ("...") and empty scalars are always strings
  if (node.Tag() == "!" || scalar_value.empty()) {
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
      throw util::InvalidArgument("Unsupported YAML node");
  }
}

namespace {

doccache::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  // An empty document selects every default.
  if (yaml.IsNull()) {
    return {};
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  doccache::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  if (config.cache().max_batch_keys() > kMaxBatchKeysLimit) {
    throw util::InvalidArgument("Invalid configuration: cache.max_batch_keys must not exceed " + std::to_string(kMaxBatchKeysLimit));
  }

  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

doccache::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

doccache::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(node);
}

} // namespace doccache::config
