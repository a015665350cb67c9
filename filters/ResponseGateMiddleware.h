#pragma once
#include <ResponseGate.h>
#include <drogon/HttpMiddleware.h>
#include <memory>

/**
 * @brief Binds a ResponseGate to drogon routes. Add "ResponseGateMiddleware"
 * to a handler's constraints to gate its responses.
 *
 * Not auto-created, main registers an instance sharing the application's gate.
 */
class ResponseGateMiddleware
    : public drogon::HttpMiddleware<ResponseGateMiddleware, false> {
private:
  std::shared_ptr<const ResponseGate> gate;

public:
  explicit ResponseGateMiddleware(std::shared_ptr<const ResponseGate> gate);

  void invoke(const drogon::HttpRequestPtr &req,
              drogon::MiddlewareNextCallback &&nextCb,
              drogon::MiddlewareCallback &&mcb) override;

  /**
   * @brief Run the rest of the chain once and gate its response for the
   * given context. Responses of requests already marked by markGated() are
   * forwarded as they are.
   *
   */
  void process(const RequestContext &ctx,
               drogon::MiddlewareNextCallback &&nextCb,
               drogon::MiddlewareCallback &&mcb) const;

  // Flag a request whose response has been gated outside the middleware
  static void markGated(const drogon::HttpRequestPtr &req);
  static bool isGated(const drogon::HttpRequestPtr &req);
};
