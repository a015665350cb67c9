#pragma once
#include "helper/response.h"
#include <drogon/HttpController.h>

using namespace drogon;

/**
 * @brief Endpoints producing the staging error pages on purpose.
 *
 */
class Debug : public drogon::HttpController<Debug> {
public:
  METHOD_LIST_BEGIN
  METHOD_ADD(Debug::status, "/status/{code}", Get, "ResponseGateMiddleware");
  METHOD_ADD(Debug::raise, "/raise", Get, "ResponseGateMiddleware");
  METHOD_LIST_END

  void status(const HttpRequestPtr &req,
              std::function<void(const HttpResponsePtr &)> &&callback,
              int code) const;

  // Throws, the exception handler renders the page
  void raise(const HttpRequestPtr &req,
             std::function<void(const HttpResponsePtr &)> &&callback) const;
};
