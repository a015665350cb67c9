#pragma once
#include <ResponseGate.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <exception>
#include <functional>
#include <memory>
#include <string>

using ResponseCallback = std::function<void(const drogon::HttpResponsePtr &)>;

/**
 * @brief Default handler for requests no route matches. The gate decides on
 * every request, nothing is cached between callers.
 *
 */
class UnmatchedRouteHandler {
private:
  std::shared_ptr<const ResponseGate> gate;
  // Renders the not found page for the failed request
  ResponseGate::Downstream page;

public:
  UnmatchedRouteHandler(std::shared_ptr<const ResponseGate> gate,
                        ResponseGate::Downstream page);

  void operator()(const drogon::HttpRequestPtr &req,
                  ResponseCallback &&callback) const;
  void handle(const RequestContext &ctx, ResponseCallback &&callback) const;
};

/**
 * @brief Exception handler rendering the staging page through the gate.
 *
 * The request is marked with ResponseGateMiddleware::markGated() so that a
 * middleware further out in the chain forwards the result untouched.
 */
class GatedExceptionHandler {
public:
  using Renderer = std::function<drogon::HttpResponsePtr(
      const drogon::HttpRequestPtr &, const std::string &)>;

private:
  std::shared_ptr<const ResponseGate> gate;
  Renderer page;

public:
  GatedExceptionHandler(std::shared_ptr<const ResponseGate> gate,
                        Renderer page);

  void operator()(const std::exception &ex, const drogon::HttpRequestPtr &req,
                  ResponseCallback &&callback) const;
  void handle(const std::exception &ex, const RequestContext &ctx,
              ResponseCallback &&callback) const;
};
