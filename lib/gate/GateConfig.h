#pragma once
#include <ConfigurationError.h>
#include <SensitiveRange.h>
#include <jsoncpp/json/value.h>
#include <string>

/**
 * @brief Options of the response gate. Read from the "response_gate" object
 * of drogon's custom_config.
 *
 */
class GateConfig {
public:
  static const char *const defaultBodyTemplate;

  // Statuses hidden from unauthenticated callers
  SensitiveRange sensitiveRange{400, 599};
  // Status, content type and body template of the substitute response.
  // "{status}" in the template is replaced by the hidden status code.
  int substituteStatus = 401;
  std::string substituteContentType = "text/html";
  std::string substituteBodyTemplate = defaultBodyTemplate;
  // Session entry holding the SessionToken of a logged in user
  std::string identitySessionKey = "token";

  /**
   * @brief Build a configuration from a JSON object. Keys that are missing
   * keep their default value.
   *
   * @param json The "response_gate" object, may be null
   * @return GateConfig A validated configuration
   * @throws ConfigurationError if a value has the wrong type or the result
   * doesn't pass validate()
   */
  static GateConfig fromJson(const Json::Value &json);

  // fromJson() on the "response_gate" member of drogon's custom_config
  static GateConfig fromCustomConfig(const Json::Value &customConfig);

  /**
   * @brief Check the configuration as a whole
   *
   * @throws ConfigurationError
   */
  void validate() const;
};
