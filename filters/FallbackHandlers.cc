#include "FallbackHandlers.h"
#include "ResponseGateMiddleware.h"
#include <trantor/utils/Logger.h>

UnmatchedRouteHandler::UnmatchedRouteHandler(
    std::shared_ptr<const ResponseGate> gate, ResponseGate::Downstream page)
    : gate{std::move(gate)}, page{std::move(page)} {}

void UnmatchedRouteHandler::operator()(const drogon::HttpRequestPtr &req,
                                       ResponseCallback &&callback) const {
  this->handle(
      RequestContext::fromRequest(req, this->gate->config().identitySessionKey),
      std::move(callback));
}

void UnmatchedRouteHandler::handle(const RequestContext &ctx,
                                   ResponseCallback &&callback) const {
  if (ctx.request()) {
    LOG_DEBUG << "No route matches " << ctx.request()->getPath();
  }
  callback(this->gate->handle(ctx, this->page));
}

GatedExceptionHandler::GatedExceptionHandler(
    std::shared_ptr<const ResponseGate> gate, Renderer page)
    : gate{std::move(gate)}, page{std::move(page)} {}

void GatedExceptionHandler::operator()(const std::exception &ex,
                                       const drogon::HttpRequestPtr &req,
                                       ResponseCallback &&callback) const {
  this->handle(
      ex,
      RequestContext::fromRequest(req, this->gate->config().identitySessionKey),
      std::move(callback));
}

void GatedExceptionHandler::handle(const std::exception &ex,
                                   const RequestContext &ctx,
                                   ResponseCallback &&callback) const {
  LOG_ERROR << "An exception occured: " << ex.what();
  ResponseGateMiddleware::markGated(ctx.request());
  std::string detail{ex.what()};
  callback(this->gate->handle(ctx, [this, &detail](const RequestContext &c) {
    return this->page(c.request(), detail);
  }));
}
