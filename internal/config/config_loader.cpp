#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/model/event_category.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace household::config {

using household::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
      throw util::InvalidConfig("Unsupported YAML node");
  }
}

static bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

static void SetMillis(google::protobuf::Duration* d, int64_t ms) {
  d->set_seconds(ms / 1000);
  d->set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
}

static void DefaultDuration(google::protobuf::Duration* d, int64_t ms) {
  if (IsUnset(*d)) SetMillis(d, ms);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw util::InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* discovery = config.mutable_discovery();
  DefaultDuration(discovery->mutable_scan_interval(), 30000);
  DefaultDuration(discovery->mutable_response_window(), 1500);
  DefaultDuration(discovery->mutable_removal_after(), 600000);
  if (discovery->liveness_intervals() == 0) discovery->set_liveness_intervals(3);
  if (discovery->multicast_address().empty()) discovery->set_multicast_address("239.255.255.250");
  if (discovery->multicast_port() == 0) discovery->set_multicast_port(1900);
  if (discovery->search_target().empty()) discovery->set_search_target("urn:schemas-upnp-org:device:ZonePlayer:1");

  auto* subscriptions = config.mutable_subscriptions();
  DefaultDuration(subscriptions->mutable_requested_timeout(), 1800000);
  DefaultDuration(subscriptions->mutable_renewal_margin(), 60000);
  DefaultDuration(subscriptions->mutable_request_timeout(), 5000);
  DefaultDuration(subscriptions->mutable_initial_backoff(), 1000);
  DefaultDuration(subscriptions->mutable_max_backoff(), 60000);
  if (subscriptions->max_attempts() == 0) subscriptions->set_max_attempts(3);
  if (subscriptions->categories().empty()) {
    for (auto category : model::kAllCategories) {
      subscriptions->add_categories(std::string(model::CategoryName(category)));
    }
  }

  auto* callback = config.mutable_callback();
  if (callback->bind_address().empty()) callback->set_bind_address("0.0.0.0");
  if (callback->port() == 0 && !callback->allow_ephemeral_port()) callback->set_port(3400);
  if (callback->threads() == 0) callback->set_threads(2);

  auto* topology = config.mutable_topology();
  DefaultDuration(topology->mutable_coordinator_grace(), 10000);
  DefaultDuration(topology->mutable_conflict_window(), 30000);

  DefaultDuration(config.mutable_transport()->mutable_action_timeout(), 5000);

  if (config.workers().threads() == 0) config.mutable_workers()->set_threads(4);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& level = config.logging().level();
  if (!level.empty() && !observability::ParseLogLevel(level)) {
    throw util::InvalidConfig("logging.level: unknown level '" + level + "'");
  }

  const auto& discovery = config.discovery();
  if (util::FromProto(discovery.scan_interval()).count() <= 0) {
    throw util::InvalidConfig("discovery.scan_interval must be positive");
  }
  if (discovery.liveness_intervals() < 1) {
    throw util::InvalidConfig("discovery.liveness_intervals must be at least 1");
  }
  if (util::FromProto(discovery.response_window()) >= util::FromProto(discovery.scan_interval())) {
    throw util::InvalidConfig("discovery.response_window must be shorter than discovery.scan_interval");
  }
  if (discovery.multicast_port() > 65535) {
    throw util::InvalidConfig("discovery.multicast_port out of range");
  }

  const auto& subs = config.subscriptions();
  if (subs.max_attempts() == 0) {
    throw util::InvalidConfig("subscriptions.max_attempts must be at least 1");
  }
  // A failed renewal plus the fallback subscribe must both fit in the margin.
  if (util::FromProto(subs.request_timeout()) * 2 >= util::FromProto(subs.renewal_margin())) {
    throw util::InvalidConfig("subscriptions.renewal_margin must exceed twice subscriptions.request_timeout");
  }
  if (util::FromProto(subs.renewal_margin()) >= util::FromProto(subs.requested_timeout())) {
    throw util::InvalidConfig("subscriptions.renewal_margin must be smaller than subscriptions.requested_timeout");
  }
  if (util::FromProto(subs.initial_backoff()) > util::FromProto(subs.max_backoff())) {
    throw util::InvalidConfig("subscriptions.initial_backoff exceeds subscriptions.max_backoff");
  }
  for (const auto& name : subs.categories()) {
    if (!model::ParseCategory(name)) {
      throw util::InvalidConfig("subscriptions.categories: unknown category '" + name + "'");
    }
  }

  const auto& callback = config.callback();
  if (callback.port() == 0 && !callback.allow_ephemeral_port()) {
    throw util::InvalidConfig("callback.port must be set unless callback.allow_ephemeral_port is true");
  }
  if (callback.port() > 65535) {
    throw util::InvalidConfig("callback.port out of range");
  }
  if (callback.threads() == 0 || config.workers().threads() == 0) {
    throw util::InvalidConfig("thread counts must be positive");
  }
}

} // namespace household::config
