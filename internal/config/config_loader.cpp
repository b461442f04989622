#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vault::config {

using vault::runtime::config::RuntimeConfig;

namespace {

constexpr int64_t  kDefaultTtlSeconds    = 10 * 60;
constexpr int64_t  kMaxTtlSeconds        = 8 * 60 * 60;
constexpr int64_t  kFailureWindowSeconds = 15 * 60;
constexpr uint64_t kMaxRequests          = 100;
constexpr uint64_t kMaxBytes             = 10ull * 1024 * 1024;
constexpr uint32_t kTokenBytes           = 32;
constexpr uint32_t kLockoutThreshold     = 5;
constexpr uint32_t kQueueCapacity        = 1024;
constexpr uint32_t kMaxRetries           = 3;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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
      throw util::ValidationError("unsupported YAML node");
  }
}

void SetSeconds(google::protobuf::Duration* duration, int64_t seconds) {
  duration->set_seconds(seconds);
  duration->set_nanos(0);
}

bool IsUnset(const google::protobuf::Duration& duration) {
  return duration.seconds() == 0 && duration.nanos() == 0;
}

double Seconds(const google::protobuf::Duration& duration) {
  return static_cast<double>(duration.seconds()) + duration.nanos() / 1e9;
}

void RequireScore(double value, const std::string& what) {
  if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
    throw util::ValidationError(what + " must be within [0,100]");
  }
}

} // namespace

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  if (config.database().backend_case() == vault::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite()) {
    auto* sqlite = config.mutable_database()->mutable_sqlite();
    if (IsUnset(sqlite->busy_timeout())) SetSeconds(sqlite->mutable_busy_timeout(), 5);
  }
  if (config.database().has_postgres()) {
    auto* postgres = config.mutable_database()->mutable_postgres();
    if (postgres->max_connections() == 0) postgres->set_max_connections(4);
    if (IsUnset(postgres->acquire_timeout())) SetSeconds(postgres->mutable_acquire_timeout(), 30);
  }

  auto* identity = config.mutable_identity();
  if (identity->default_record_source().empty()) identity->set_default_record_source("vault");

  auto* sessions = config.mutable_sessions();
  if (IsUnset(sessions->default_ttl())) SetSeconds(sessions->mutable_default_ttl(), kDefaultTtlSeconds);
  if (IsUnset(sessions->max_ttl())) SetSeconds(sessions->mutable_max_ttl(), kMaxTtlSeconds);
  if (IsUnset(sessions->failure_window())) SetSeconds(sessions->mutable_failure_window(), kFailureWindowSeconds);
  if (sessions->max_requests() == 0) sessions->set_max_requests(kMaxRequests);
  if (sessions->max_bytes() == 0) sessions->set_max_bytes(kMaxBytes);
  if (sessions->token_bytes() == 0) sessions->set_token_bytes(kTokenBytes);
  if (!sessions->has_lockout_threshold()) sessions->set_lockout_threshold(kLockoutThreshold);

  auto* risk = config.mutable_risk();
  if (!risk->has_weights()) {
    auto* weights = risk->mutable_weights();
    weights->set_device(1.0);
    weights->set_network(1.0);
    weights->set_behavior(1.0);
    weights->set_content(1.0);
  }
  if (!risk->has_tiers()) {
    auto* tiers = risk->mutable_tiers();
    tiers->set_full_max(20.0);
    tiers->set_standard_max(40.0);
    tiers->set_elevated_max(80.0);
  }

  auto* audit = config.mutable_audit();
  if (audit->sink().empty()) audit->set_sink("log");
  if (audit->queue_capacity() == 0) audit->set_queue_capacity(kQueueCapacity);
  if (audit->max_retries() == 0) audit->set_max_retries(kMaxRetries);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& weights = config.risk().weights();
  for (double w : {weights.device(), weights.network(), weights.behavior(), weights.content()}) {
    if (!std::isfinite(w) || w < 0.0) throw util::ValidationError("risk weights must be non-negative");
  }
  if (weights.device() + weights.network() + weights.behavior() + weights.content() <= 0.0) {
    throw util::ValidationError("at least one risk weight must be positive");
  }

  const auto& tiers = config.risk().tiers();
  RequireScore(tiers.full_max(), "risk.tiers.full_max");
  RequireScore(tiers.standard_max(), "risk.tiers.standard_max");
  RequireScore(tiers.elevated_max(), "risk.tiers.elevated_max");
  if (!(tiers.full_max() < tiers.standard_max() && tiers.standard_max() < tiers.elevated_max())) {
    throw util::ValidationError("risk tier bounds must be strictly increasing");
  }

  for (const auto& category : config.risk().restricted_categories()) {
    if (category.category().empty()) throw util::ValidationError("restricted category name must not be empty");
    RequireScore(category.sensitivity(), "sensitivity of " + category.category());
  }

  const auto& sessions = config.sessions();
  if (Seconds(sessions.default_ttl()) <= 0.0 || Seconds(sessions.max_ttl()) <= 0.0) {
    throw util::ValidationError("session ttl must be positive");
  }
  if (Seconds(sessions.default_ttl()) > Seconds(sessions.max_ttl())) {
    throw util::ValidationError("sessions.default_ttl exceeds sessions.max_ttl");
  }
  if (sessions.token_bytes() < 16) {
    throw util::ValidationError("sessions.token_bytes must be at least 16");
  }

  const auto& audit = config.audit();
  if (audit.sink() != "log" && audit.sink() != "none") {
    throw util::ValidationError("audit.sink must be \"log\" or \"none\"");
  }

  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw util::ValidationError("database.sqlite.path is required");
  }
  if (database.has_sqlite() && Seconds(database.sqlite().busy_timeout()) < 0.0) {
    throw util::ValidationError("database.sqlite.busy_timeout must not be negative");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw util::ValidationError("database.postgres.connection_uri is required");
  }
  if (database.has_postgres() && Seconds(database.postgres().acquire_timeout()) <= 0.0) {
    throw util::ValidationError("database.postgres.acquire_timeout must be positive");
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

  RuntimeConfig config;

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
      throw util::ValidationError("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace vault::config
