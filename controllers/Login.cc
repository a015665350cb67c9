#include "Login.h"
#include <GateConfig.h>
#include <RequestContext.h>

Login::Login()
    : sessionKey{GateConfig::fromCustomConfig(app().getCustomConfig())
                     .identitySessionKey} {}

drogon::AsyncTask
Login::login(HttpRequestPtr req,
             std::function<void(const HttpResponsePtr &)> callback,
             std::string name) {
  LOG_DEBUG << "Request on " << req->getPath() << " from "
            << req->getPeerAddr().toIp();
  try {
    // A blank name would store a token the gate ignores
    if (!RequestContext{req, name}.isAuthenticated()) {
      throw std::invalid_argument{"A user name is required"};
    }

    auto sToken = SessionToken::forUser(name);
    auto sessionPtr = req->session();
    if (sessionPtr->find(this->sessionKey)) {
      LOG_DEBUG << "Replacing the token under " << this->sessionKey;
      sessionPtr->modify<SessionToken>(
          this->sessionKey,
          [sToken](SessionToken &token) { token = sToken; });
    } else {
      sessionPtr->insert(this->sessionKey, sToken);
    }
    LOG_INFO << "User " << name << " logged in";

    callback(drogon::HttpResponse::newHttpJsonResponse(*sToken.getJson()));
  } catch (std::invalid_argument &ex) {
    LOG_INFO << "An exception occured: " << ex.what();
    callback(toError(drogon::HttpStatusCode::k400BadRequest, ex.what()));
  } catch (const std::exception &ex) {
    LOG_ERROR << "An exception occured: " << ex.what();
    callback(toError(drogon::HttpStatusCode::k500InternalServerError,
                     "Internal server error"));
  }
  co_return;
}

drogon::AsyncTask
Login::status(HttpRequestPtr req,
              std::function<void(const HttpResponsePtr &)> callback) {
  auto ctx = RequestContext::fromRequest(req, this->sessionKey);
  if (!ctx.isAuthenticated()) {
    callback(toError(drogon::HttpStatusCode::k401Unauthorized,
                     "You are not logged in"));
    co_return;
  }
  auto json = Json::Value{Json::objectValue};
  json["name"] = *ctx.identityMarker();
  callback(drogon::HttpResponse::newHttpJsonResponse(json));
  co_return;
}
