#include "RequestContext.h"
#include "SessionToken.h"
#include <algorithm>
#include <cctype>
#include <trantor/utils/Logger.h>

namespace {
std::optional<std::string> normalize(std::optional<std::string> identity) {
  if (!identity) {
    return std::nullopt;
  }
  auto blank = std::all_of(identity->cbegin(), identity->cend(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
  if (blank) {
    return std::nullopt;
  }
  return identity;
}
} // namespace

RequestContext::RequestContext(drogon::HttpRequestPtr req,
                               std::optional<std::string> identity)
    : req{std::move(req)}, identity{normalize(std::move(identity))} {}

RequestContext RequestContext::fromRequest(const drogon::HttpRequestPtr &req,
                                           const std::string &sessionKey) {
  if (!req) {
    return RequestContext{req};
  }
  return fromSession(req, req->session(), sessionKey);
}

RequestContext RequestContext::fromSession(const drogon::HttpRequestPtr &req,
                                           const drogon::SessionPtr &sessionPtr,
                                           const std::string &sessionKey) {
  if (!sessionPtr || !sessionPtr->find(sessionKey)) {
    return RequestContext{req};
  }
  auto sToken = sessionPtr->get<SessionToken>(sessionKey);
  if (!sToken.userName) {
    LOG_WARN << "Session token without user name under " << sessionKey;
    return RequestContext{req};
  }
  return RequestContext{req, *sToken.userName};
}
