#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <initializer_list>
#include <stdexcept>

namespace vodbridge::config {

namespace {

using google::protobuf::RepeatedPtrField;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("123" is an id, not a number)
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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
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

void DefaultList(RepeatedPtrField<std::string>* field, std::initializer_list<const char*> values) {
  if (!field->empty()) {
    return;
  }
  for (const char* v : values) {
    field->Add(v);
  }
}

void DefaultString(std::string* field, const char* value) {
  if (field->empty()) {
    *field = value;
  }
}

} // namespace

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(vodbridge::runtime::config::RuntimeConfig* config) {
  DefaultString(config->mutable_server()->mutable_bind_address(), "127.0.0.1:50071");

  auto* host = config->mutable_host();
  DefaultString(host->mutable_jsonrpc_url(), "http://127.0.0.1:8080/jsonrpc");
  DefaultString(host->mutable_action_method(), "Addons.ExecuteAddon");
  if (host->timeout_ms() == 0) host->set_timeout_ms(10000);

  auto* backend = config->mutable_backend();
  DefaultList(backend->mutable_candidate_ids(), {"plugin.video.amazon-test", "plugin.video.amazonvod", "plugin.video.primevideo"});
  DefaultString(backend->mutable_category(), "xbmc.python.pluginsource");
  DefaultList(backend->mutable_id_prefixes(), {"plugin.video.amazon", "plugin.video.prime"});
  DefaultList(backend->mutable_strategies(), {"direct", "rpc"});

  auto* direct = config->mutable_direct();
  DefaultList(direct->mutable_module_names(), {"resources.lib.backend", "resources.lib.primevideo", "resources.lib.api", "backend"});
  DefaultList(direct->mutable_class_names(), {"PrimeVideo", "AmazonVOD", "Provider", "Backend", "API"});

  // direct.methods.* left empty selects the capability probe's compiled candidates

  auto* cache = config->mutable_cache();
  DefaultString(cache->mutable_root_path(), "/tmp/vodbridge/cache");
  if (!cache->has_enabled()) cache->set_enabled(true);
  if (cache->ttl_seconds() == 0) cache->set_ttl_seconds(300);
  if (cache->playable_ttl_seconds() == 0) cache->set_playable_ttl_seconds(60);

  auto* content = config->mutable_content();
  if (content->rail_limit() == 0) content->set_rail_limit(20);
  if (content->search_limit() == 0) content->set_search_limit(30);
  DefaultString(content->mutable_root_rail_id(), "root");

  auto* preflight = config->mutable_preflight();
  if (!preflight->has_enabled()) preflight->set_enabled(true);
  DefaultString(preflight->mutable_component_id(), "inputstream.adaptive");
  DefaultString(preflight->mutable_session_path(), "/tmp/vodbridge/session.json");

  auto* diagnostics = config->mutable_diagnostics();
  if (diagnostics->home_cold_threshold_ms() <= 0) diagnostics->set_home_cold_threshold_ms(1500.0);
  if (diagnostics->home_warm_threshold_ms() <= 0) diagnostics->set_home_warm_threshold_ms(300.0);
  if (diagnostics->rail_cold_threshold_ms() <= 0) diagnostics->set_rail_cold_threshold_ms(800.0);
  if (diagnostics->rail_warm_threshold_ms() <= 0) diagnostics->set_rail_warm_threshold_ms(100.0);
  DefaultList(diagnostics->mutable_clear_prefixes(), {"home:", "rail:"});
}

vodbridge::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  vodbridge::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

vodbridge::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  vodbridge::runtime::config::RuntimeConfig config;

  // an empty document is a valid, all-defaults configuration
  if (yaml.IsNull()) {
    ApplyDefaults(&config);
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

  ApplyDefaults(&config);
  return config;
}

} // namespace vodbridge::config
