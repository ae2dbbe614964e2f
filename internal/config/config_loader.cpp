#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace eryzaa::config {

using google::protobuf::util::TimeUtil;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("0660", "8056c2e21c000001")
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

static void DefaultDuration(google::protobuf::Duration* d, int64_t seconds) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    *d = TimeUtil::SecondsToDuration(seconds);
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

eryzaa::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  eryzaa::runtime::config::RuntimeConfig config;

  // an empty document is a valid "all defaults" config
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
  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(eryzaa::runtime::config::RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* node = config.mutable_node();
  if (node->kind().empty()) node->set_kind("rental");
  if (node->ip_address().empty()) node->set_ip_address("127.0.0.1");
  if (node->ssh_port() == 0) node->set_ssh_port(22);
  if (node->api_port() == 0) node->set_api_port(8080);

  auto* discovery = config.mutable_discovery();
  if (discovery->port() == 0) discovery->set_port(9999);
  if (discovery->bind_address().empty()) discovery->set_bind_address("0.0.0.0");
  if (discovery->multicast_group().empty()) discovery->set_multicast_group("239.255.255.250");
  if (discovery->broadcast_addresses().empty()) {
    discovery->add_broadcast_addresses("10.242.0.255");
    discovery->add_broadcast_addresses("10.243.0.255");
    discovery->add_broadcast_addresses("192.168.191.255");
  }
  DefaultDuration(discovery->mutable_advertise_interval(), 30);
  DefaultDuration(discovery->mutable_janitor_interval(), 60);
  DefaultDuration(discovery->mutable_staleness_window(), 120);
  DefaultDuration(discovery->mutable_receive_timeout(), 1);
  DefaultDuration(discovery->mutable_probe_timeout(), 5);
  if (discovery->overlay_cli().empty()) discovery->set_overlay_cli("zerotier-cli");

  auto* access = config.mutable_access();
  if (access->helper_socket().empty()) access->set_helper_socket("/run/eryzaa/access-helper.sock");
  DefaultDuration(access->mutable_helper_timeout(), 5);
  if (!access->has_use_sudo()) access->set_use_sudo(true);
  if (access->login_shell().empty()) access->set_login_shell("/bin/bash");
  if (!access->has_privileged_group()) access->set_privileged_group("docker");
  DefaultDuration(access->mutable_default_lease(), 3600);
  DefaultDuration(access->mutable_cleanup_interval(), 60);

  auto* helper = config.mutable_helper();
  if (helper->socket_mode().empty()) helper->set_socket_mode("0660");

  auto* observability = config.mutable_observability();
  DefaultDuration(observability->mutable_metrics_interval(), 10);
}

} // namespace eryzaa::config
