#include "ResponseGateMiddleware.h"

namespace {
const std::string gatedAttribute = "response_gate.gated";
} // namespace

ResponseGateMiddleware::ResponseGateMiddleware(
    std::shared_ptr<const ResponseGate> gate)
    : gate{std::move(gate)} {}

void ResponseGateMiddleware::invoke(const drogon::HttpRequestPtr &req,
                                    drogon::MiddlewareNextCallback &&nextCb,
                                    drogon::MiddlewareCallback &&mcb) {
  this->process(
      RequestContext::fromRequest(req, this->gate->config().identitySessionKey),
      std::move(nextCb), std::move(mcb));
}

void ResponseGateMiddleware::process(const RequestContext &ctx,
                                     drogon::MiddlewareNextCallback &&nextCb,
                                     drogon::MiddlewareCallback &&mcb) const {
  nextCb([gate = this->gate, ctx,
          mcb = std::move(mcb)](const drogon::HttpResponsePtr &resp) {
    if (isGated(ctx.request())) {
      mcb(resp);
      return;
    }
    mcb(gate->filter(ctx, resp));
  });
}

void ResponseGateMiddleware::markGated(const drogon::HttpRequestPtr &req) {
  if (req) {
    req->attributes()->insert(gatedAttribute, true);
  }
}

bool ResponseGateMiddleware::isGated(const drogon::HttpRequestPtr &req) {
  return req && req->attributes()->find(gatedAttribute);
}
