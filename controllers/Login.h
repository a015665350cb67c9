#pragma once
#include <SessionToken.h>
#include <drogon/HttpController.h>
#include <helper/response.h>

using namespace drogon;

/**
 * @brief Staging login. Stores a SessionToken for the given name, no
 * credentials are checked. The token is kept under the gate's
 * identity_session_key.
 *
 */
class Login : public drogon::HttpController<Login> {
private:
  std::string sessionKey;

public:
  METHOD_LIST_BEGIN
  METHOD_ADD(Login::login, "/{name}", Post, "ResponseGateMiddleware");
  METHOD_ADD(Login::status, "/session/status", Get, "ResponseGateMiddleware");
  METHOD_LIST_END
  Login();

  drogon::AsyncTask login(HttpRequestPtr req,
                          std::function<void(const HttpResponsePtr &)> callback,
                          std::string name);

  drogon::AsyncTask
  status(HttpRequestPtr req,
         std::function<void(const HttpResponsePtr &)> callback);
};
