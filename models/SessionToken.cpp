#include "SessionToken.h"
#include <chrono>

SessionToken::SessionToken() {}

SessionToken SessionToken::forUser(const std::string &name) {
  auto sToken = SessionToken{};
  sToken.userName = std::make_shared<std::string>(name);
  sToken.tm = std::make_shared<int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  return sToken;
}

std::unique_ptr<Json::Value> SessionToken::getJson() const {
  auto json = std::make_unique<Json::Value>(Json::objectValue);
  (*json)["authenticated"] = static_cast<bool>(this->userName);
  if (this->userName) {
    (*json)["name"] = *this->userName;
  }
  if (this->tm) {
    (*json)["tm"] = static_cast<Json::Int64>(*this->tm);
  }
  return json;
}
