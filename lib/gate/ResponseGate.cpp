#include "ResponseGate.h"
#include <trantor/utils/Logger.h>

ResponseGate::ResponseGate(GateConfig config)
    : cfg{std::move(config)},
      substitute{cfg.substituteStatus, cfg.substituteContentType,
                 cfg.substituteBodyTemplate} {
  this->cfg.validate();
}

drogon::HttpResponsePtr
ResponseGate::handle(const RequestContext &ctx,
                     const Downstream &downstream) const {
  auto response = downstream(ctx);
  return this->filter(ctx, response);
}

drogon::HttpResponsePtr
ResponseGate::filter(const RequestContext &ctx,
                     const drogon::HttpResponsePtr &response) const {
  if (!response) {
    LOG_WARN << "Downstream handler produced no response";
    return response;
  }
  auto status = static_cast<int>(response->getStatusCode());
  if (!this->shouldHide(ctx, status)) {
    return response;
  }
  if (ctx.request()) {
    LOG_DEBUG << "Hiding status " << status << " on "
              << ctx.request()->getPath() << " from unauthenticated caller";
  }
  return this->substitute.build(status);
}

bool ResponseGate::shouldHide(const RequestContext &ctx, int status) const {
  return !ctx.isAuthenticated() && this->cfg.sensitiveRange.contains(status);
}
