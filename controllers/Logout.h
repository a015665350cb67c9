#pragma once
#include "helper/response.h"
#include <drogon/HttpController.h>

using namespace drogon;

class Logout : public drogon::HttpController<Logout> {
private:
  std::string sessionKey;

public:
  METHOD_LIST_BEGIN
  METHOD_ADD(Logout::logout, "", Post, "ResponseGateMiddleware");
  METHOD_LIST_END
  Logout();

  drogon::AsyncTask
  logout(HttpRequestPtr req,
         std::function<void(const HttpResponsePtr &)> callback);
};
