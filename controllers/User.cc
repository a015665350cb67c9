#include "User.h"
#include <GateConfig.h>

User::User()
    : sessionKey{GateConfig::fromCustomConfig(app().getCustomConfig())
                     .identitySessionKey} {}

drogon::AsyncTask
User::info(HttpRequestPtr req,
           std::function<void(const HttpResponsePtr &)> callback) const {
  LOG_DEBUG << "Request on " << req->getPath() << " from "
            << req->getPeerAddr().toIp();
  auto sessionPtr = req->getSession();
  if (!sessionPtr || !sessionPtr->find(this->sessionKey)) {
    LOG_INFO << "No session token on " << req->getPath();
    callback(toError(drogon::HttpStatusCode::k401Unauthorized,
                     "You must be logged in to use this functionality"));
    co_return;
  }
  SessionToken sToken = sessionPtr->get<SessionToken>(this->sessionKey);
  auto jsonPtr = sToken.getJson();

  callback(drogon::HttpResponse::newHttpJsonResponse(*jsonPtr));
  co_return;
}
