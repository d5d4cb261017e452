#include "config_loader.hpp"

#include <google/protobuf/duration.pb.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace pulsetx::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("10s", "0.0.0.0:50061")
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

static bool IsPositive(const google::protobuf::Duration& d) {
  return d.seconds() > 0 || (d.seconds() == 0 && d.nanos() > 0);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

pulsetx::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  pulsetx::runtime::config::RuntimeConfig config;

  // an empty document means "all defaults"
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
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
  }

  if (const char* api_key = std::getenv("PULSETX_RPC_API_KEY")) {
    config.mutable_ledger()->set_api_key(api_key);
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(pulsetx::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* ledger = config.mutable_ledger();
  if (ledger->rpc_url().empty()) {
    ledger->set_rpc_url(kDefaultRpcUrl);
  }
  if (ledger->page_limit() == 0) {
    ledger->set_page_limit(kDefaultPageLimit);
  }
  if (!ledger->has_request_timeout()) {
    ledger->mutable_request_timeout()->set_seconds(kDefaultRequestTimeoutS);
  }
  if (!ledger->has_connect_timeout()) {
    ledger->mutable_connect_timeout()->set_seconds(kDefaultConnectTimeoutS);
  }
}

void ConfigLoader::Validate(const pulsetx::runtime::config::RuntimeConfig& config) {
  const auto& ledger = config.ledger();

  if (ledger.rpc_url().empty()) {
    throw std::runtime_error("Invalid configuration: ledger.rpc_url must be set");
  }

  if (ledger.page_limit() == 0 || ledger.page_limit() > kMaxPageLimit) {
    std::ostringstream msg;
    msg << "Invalid configuration: ledger.page_limit must be within 1.." << kMaxPageLimit << ", got " << ledger.page_limit();
    throw std::runtime_error(msg.str());
  }

  if (!IsPositive(ledger.request_timeout())) {
    throw std::runtime_error("Invalid configuration: ledger.request_timeout must be positive");
  }
  if (!IsPositive(ledger.connect_timeout())) {
    throw std::runtime_error("Invalid configuration: ledger.connect_timeout must be positive");
  }
}

} // namespace pulsetx::config
