#pragma once
#include <cstdint>
#include <jsoncpp/json/value.h>
#include <memory>
#include <string>

/**
 * @brief Value a staging login stores in the session. Its user name is the
 * identity marker the response gate looks for.
 *
 */
class SessionToken {
public:
  // Name the user logged in with
  std::shared_ptr<std::string> userName;
  // Login time in seconds since epoch
  std::shared_ptr<int64_t> tm;

  SessionToken();

  /**
   * @brief Create a token for name, logged in now
   *
   * @param name The user name, stored as given
   * @return SessionToken
   */
  static SessionToken forUser(const std::string &name);

  std::unique_ptr<Json::Value> getJson() const;
};
