#include "Debug.h"
#include <stdexcept>

void Debug::status(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback,
                   int code) const {
  LOG_DEBUG << "Request on " << req->getPath() << " from "
            << req->getPeerAddr().toIp();
  if (code < 100 || code > 599) {
    callback(toError(drogon::HttpStatusCode::k400BadRequest,
                     "Status code must be between 100 and 599"));
    return;
  }
  callback(toDebugPage(static_cast<drogon::HttpStatusCode>(code), req,
                       "Requested status " + std::to_string(code)));
}

void Debug::raise(const HttpRequestPtr &req,
                  std::function<void(const HttpResponsePtr &)> &&callback)
    const {
  LOG_DEBUG << "Request on " << req->getPath() << " from "
            << req->getPeerAddr().toIp();
  throw std::runtime_error{"Raised on purpose by " + req->getPath()};
}
