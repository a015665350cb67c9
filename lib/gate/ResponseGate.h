#pragma once
#include <GateConfig.h>
#include <RequestContext.h>
#include <SubstituteResponse.h>
#include <drogon/HttpResponse.h>
#include <functional>

/**
 * @brief Hides error responses from callers without an identity marker.
 *
 * The gate wraps a downstream handler. Whenever the caller is not
 * authenticated and the downstream status lies in the configured sensitive
 * range, the whole response is replaced by a fixed substitute. Every other
 * response is returned as the same object, untouched.
 *
 * A gate holds no mutable state and may be shared between threads.
 */
class ResponseGate {
public:
  using Downstream =
      std::function<drogon::HttpResponsePtr(const RequestContext &)>;

private:
  GateConfig cfg;
  SubstituteResponse substitute;

public:
  /**
   * @brief Construct a new Response Gate object
   *
   * @param config Gate options. Validated again here.
   * @throws ConfigurationError
   */
  explicit ResponseGate(GateConfig config = GateConfig{});

  /**
   * @brief Invoke the downstream handler once and gate its response.
   * Exceptions thrown by the downstream handler are not caught.
   *
   * @param ctx The request context
   * @param downstream Produces the real response
   * @return drogon::HttpResponsePtr The downstream response or a substitute
   */
  drogon::HttpResponsePtr handle(const RequestContext &ctx,
                                 const Downstream &downstream) const;

  /**
   * @brief Gate a response that has already been produced
   *
   * @param ctx The request context
   * @param response The downstream response. A null response is returned
   * as is.
   * @return drogon::HttpResponsePtr
   */
  drogon::HttpResponsePtr filter(const RequestContext &ctx,
                                 const drogon::HttpResponsePtr &response) const;

  bool shouldHide(const RequestContext &ctx, int status) const;

  const GateConfig &config() const { return this->cfg; }
};
