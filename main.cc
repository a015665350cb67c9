#include <FallbackHandlers.h>
#include <ResponseGate.h>
#include <ResponseGateMiddleware.h>
#include <controllers/helper/response.h>
#include <cstdlib>
#include <drogon/drogon.h>
#include <glog/logging.h>

int main() {
  google::InitGoogleLogging("");
  FLAGS_logtostderr = 1;
  drogon::app().addListener("0.0.0.0", 80);
  drogon::app().loadConfigFile("../config.json");

  std::shared_ptr<const ResponseGate> gate;
  try {
    auto gateConfig =
        GateConfig::fromCustomConfig(drogon::app().getCustomConfig());
    gate = std::make_shared<const ResponseGate>(std::move(gateConfig));
  } catch (const ConfigurationError &ex) {
    LOG(ERROR) << "Invalid response_gate configuration: " << ex.what();
    return EXIT_FAILURE;
  }

  drogon::app().registerMiddleware(
      std::make_shared<ResponseGateMiddleware>(gate));
  drogon::app().setExceptionHandler(GatedExceptionHandler{
      gate, [](const drogon::HttpRequestPtr &req, const std::string &detail) {
        return toDebugPage(drogon::k500InternalServerError, req, detail);
      }});

  // Unmatched routes never reach a middleware
  drogon::app().setDefaultHandler(UnmatchedRouteHandler{
      gate, [](const RequestContext &ctx) {
        const auto &req = ctx.request();
        auto detail = req ? "No route matches " +
                                std::string{req->getMethodString()} + " " +
                                req->getPath()
                          : std::string{"No route matches"};
        return toDebugPage(drogon::k404NotFound, req, detail);
      }});

  // drogon caches some of these pages, they must not depend on the request
  drogon::app().setCustomErrorHandler(
      [](drogon::HttpStatusCode code, const drogon::HttpRequestPtr &) {
        return toError(code, "Request failed with status " +
                                 std::to_string(static_cast<int>(code)));
      });

  drogon::app().run();
  return 0;
}
