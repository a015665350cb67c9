#include "Logout.h"
#include <GateConfig.h>
#include <RequestContext.h>

Logout::Logout()
    : sessionKey{GateConfig::fromCustomConfig(app().getCustomConfig())
                     .identitySessionKey} {}

drogon::AsyncTask
Logout::logout(HttpRequestPtr req,
               std::function<void(const HttpResponsePtr &)> callback) {
  LOG_DEBUG << "Request on " << req->getPath() << " from "
            << req->getPeerAddr().toIp();
  auto ctx = RequestContext::fromRequest(req, this->sessionKey);
  if (!ctx.isAuthenticated()) {
    LOG_INFO << "Logout without a session token under " << this->sessionKey;
    callback(toError(drogon::HttpStatusCode::k400BadRequest,
                     "You have to login before you can logout"));
    co_return;
  }
  req->session()->erase(this->sessionKey);
  LOG_INFO << "User " << *ctx.identityMarker() << " logged out";
  // Following errors are hidden again for this client
  callback(drogon::HttpResponse::newHttpResponse());
}
