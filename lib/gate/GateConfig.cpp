#include "GateConfig.h"
#include <trantor/utils/Logger.h>

const char *const GateConfig::defaultBodyTemplate =
    "<!DOCTYPE html><html><head><title>Unauthorized</title></head>"
    "<body><h1>Unauthorized</h1>"
    "<p>The request could not be completed (status {status}). "
    "Please log in to see more.</p></body></html>";

namespace {
int readInt(const Json::Value &json, const char *key, int fallback) {
  if (!json.isMember(key)) {
    return fallback;
  }
  const auto &value = json[key];
  if (!value.isInt()) {
    throw ConfigurationError{std::string{"response_gate."} + key +
                             " must be an integer"};
  }
  return value.asInt();
}

std::string readString(const Json::Value &json, const char *key,
                       const std::string &fallback) {
  if (!json.isMember(key)) {
    return fallback;
  }
  const auto &value = json[key];
  if (!value.isString()) {
    throw ConfigurationError{std::string{"response_gate."} + key +
                             " must be a string"};
  }
  return value.asString();
}
} // namespace

GateConfig GateConfig::fromJson(const Json::Value &json) {
  auto config = GateConfig{};
  if (json.isNull()) {
    LOG_INFO << "No response_gate configuration found. Using defaults";
    return config;
  }
  if (!json.isObject()) {
    throw ConfigurationError{"response_gate must be a JSON object"};
  }

  auto low = readInt(json, "sensitive_range_low", config.sensitiveRange.low());
  auto high =
      readInt(json, "sensitive_range_high", config.sensitiveRange.high());
  config.sensitiveRange = SensitiveRange{low, high};
  config.substituteStatus =
      readInt(json, "substitute_status", config.substituteStatus);
  config.substituteContentType = readString(json, "substitute_content_type",
                                            config.substituteContentType);
  config.substituteBodyTemplate = readString(
      json, "substitute_body_template", config.substituteBodyTemplate);
  config.identitySessionKey =
      readString(json, "identity_session_key", config.identitySessionKey);

  config.validate();
  LOG_DEBUG << "Sensitive range [" << config.sensitiveRange.low() << ", "
            << config.sensitiveRange.high() << "], substitute status "
            << config.substituteStatus;
  return config;
}

GateConfig GateConfig::fromCustomConfig(const Json::Value &customConfig) {
  if (!customConfig.isObject()) {
    return fromJson(Json::Value{});
  }
  return fromJson(customConfig["response_gate"]);
}

void GateConfig::validate() const {
  if (this->substituteStatus < 100 || this->substituteStatus > 599) {
    throw ConfigurationError{"substitute_status " +
                             std::to_string(this->substituteStatus) +
                             " is not a valid HTTP status code"};
  }
  if (this->substituteContentType.empty()) {
    throw ConfigurationError{"substitute_content_type must not be empty"};
  }
  if (this->identitySessionKey.empty()) {
    throw ConfigurationError{"identity_session_key must not be empty"};
  }
}
