#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace syncore::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
      throw std::runtime_error("Unsupported YAML node");
  }
}

static syncore::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  syncore::runtime::config::RuntimeConfig config;
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(config);
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
    throw util::ValidationError("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

static void SetDurationIfUnset(google::protobuf::Duration* duration, int64_t millis) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    duration->set_seconds(millis / 1000);
    duration->set_nanos(static_cast<int32_t>((millis % 1000) * 1000000));
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

syncore::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

syncore::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::ValidationError("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(syncore::runtime::config::RuntimeConfig& config) {
  if (config.database().backend_case() == syncore::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* queue = config.mutable_queue();
  if (queue->max_operations() == 0) queue->set_max_operations(1000);
  if (queue->checkpoint_every() == 0) queue->set_checkpoint_every(256);
  if (queue->completed_retention() == 0) queue->set_completed_retention(4096);

  auto* policy = config.mutable_policy();
  if (policy->critical_battery_percent() == 0) policy->set_critical_battery_percent(10.0);
  if (policy->low_battery_percent() == 0) policy->set_low_battery_percent(20.0);
  SetDurationIfUnset(policy->mutable_battery_recheck(), 5 * 60 * 1000);
  SetDurationIfUnset(policy->mutable_offline_recheck(), 30 * 1000);

  auto* cache = config.mutable_cache();
  if (cache->size_budget_bytes() == 0) cache->set_size_budget_bytes(64ull * 1024 * 1024);
  SetDurationIfUnset(cache->mutable_default_ttl(), 24ll * 60 * 60 * 1000);
  SetDurationIfUnset(cache->mutable_compact_interval(), 10 * 60 * 1000);

  auto* sync = config.mutable_sync();
  if (sync->max_batch() == 0) sync->set_max_batch(50);
  if (sync->max_concurrency() == 0) sync->set_max_concurrency(4);
  if (sync->schema_version() == 0) sync->set_schema_version(1);
  if (sync->pull_page_size() == 0) sync->set_pull_page_size(200);
  SetDurationIfUnset(sync->mutable_request_timeout(), 15 * 1000);

  auto* retry = sync->mutable_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(4);
  if (retry->multiplier() == 0) retry->set_multiplier(2.0);
  SetDurationIfUnset(retry->mutable_initial_backoff(), 1000);
  SetDurationIfUnset(retry->mutable_max_backoff(), 60 * 1000);

  auto* breaker = sync->mutable_circuit_breaker();
  if (breaker->failure_threshold() == 0) breaker->set_failure_threshold(5);
  SetDurationIfUnset(breaker->mutable_cooldown(), 30 * 1000);

  auto* resolver = config.mutable_resolver();
  if (resolver->role_precedence().empty()) {
    auto& roles             = *resolver->mutable_role_precedence();
    roles["head_teacher"]    = 0;
    roles["subject_teacher"] = 1;
    roles["assistant"]       = 2;
    roles["student"]         = 3;
    roles["parent"]          = 4;
  }
  SetDurationIfUnset(resolver->mutable_max_clock_skew(), 5 * 60 * 1000);

  auto* connectivity = config.mutable_connectivity();
  SetDurationIfUnset(connectivity->mutable_debounce(), 2000);
  SetDurationIfUnset(connectivity->mutable_periodic_interval(), 5 * 60 * 1000);
  if (connectivity->cellular_batch_factor() == 0) connectivity->set_cellular_batch_factor(0.5);
  if (connectivity->low_battery_batch_factor() == 0) connectivity->set_low_battery_batch_factor(0.25);
  if (connectivity->cellular_interval_factor() == 0) connectivity->set_cellular_interval_factor(2.0);
  if (connectivity->low_battery_interval_factor() == 0) connectivity->set_low_battery_interval_factor(4.0);

  if (config.remote().endpoint_case() == syncore::runtime::config::RemoteConfig::ENDPOINT_NOT_SET) {
    config.mutable_remote()->mutable_loopback();
  }
}

void ConfigLoader::Validate(const syncore::runtime::config::RuntimeConfig& config) {
  const auto& policy = config.policy();
  if (policy.critical_battery_percent() < 0 || policy.critical_battery_percent() > 100) {
    throw util::ValidationError("policy.critical_battery_percent must be within [0, 100]");
  }
  if (policy.low_battery_percent() < policy.critical_battery_percent()) {
    throw util::ValidationError("policy.low_battery_percent must not be below critical_battery_percent");
  }
  for (const auto& window : policy.blackout_windows()) {
    if (window.has_daily()) {
      const auto& daily = window.daily();
      if (daily.start_minute() >= 24 * 60 || daily.end_minute() > 24 * 60) {
        throw util::ValidationError("blackout window '" + window.name() + "' has minutes outside the day");
      }
      for (auto weekday : daily.weekdays()) {
        if (weekday > 6) {
          throw util::ValidationError("blackout window '" + window.name() + "' has weekday outside 0..6");
        }
      }
    } else if (window.has_absolute()) {
      if (window.absolute().end_ms() <= window.absolute().start_ms()) {
        throw util::ValidationError("blackout window '" + window.name() + "' ends before it starts");
      }
    } else {
      throw util::ValidationError("blackout window '" + window.name() + "' has no span");
    }
  }

  const auto& key_hex = config.cache().encryption_key_hex();
  if (!key_hex.empty()) {
    if (key_hex.size() != 64 || key_hex.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
      throw util::ValidationError("cache.encryption_key_hex must be 64 hex characters");
    }
  } else if (!config.cache().sensitive_kinds().empty()) {
    throw util::ValidationError("cache.sensitive_kinds requires cache.encryption_key_hex");
  }

  const auto& retry = config.sync().retry();
  if (retry.multiplier() < 1.0) {
    throw util::ValidationError("sync.retry.multiplier must be >= 1");
  }
  if (retry.jitter() < 0 || retry.jitter() > 1) {
    throw util::ValidationError("sync.retry.jitter must be within [0, 1]");
  }

  if (config.queue().max_operations() == 0) {
    throw util::ValidationError("queue.max_operations must be positive");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw util::ValidationError("database.sqlite.path is required");
  }
  if (config.remote().has_grpc() && config.remote().grpc().target().empty()) {
    throw util::ValidationError("remote.grpc.target is required");
  }
}

} // namespace syncore::config
