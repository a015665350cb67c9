#pragma once

#include <drogon/HttpController.h>
#include <SessionToken.h>
#include "helper/response.h"

using namespace drogon;
/**
 * @brief The User controller class represents the user that is logged in.
 *
 */
class User : public drogon::HttpController<User>
{
private:
  std::string sessionKey;

public:
  METHOD_LIST_BEGIN
  METHOD_ADD(User::info, "/info", Get, "ResponseGateMiddleware");
  METHOD_LIST_END
  User();

  drogon::AsyncTask info(HttpRequestPtr req, std::function<void(const HttpResponsePtr &)> callback) const;
};
