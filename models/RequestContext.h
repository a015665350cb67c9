#pragma once
#include <drogon/HttpRequest.h>
#include <drogon/Session.h>
#include <optional>
#include <string>

/**
 * @brief Everything the response gate needs to know about an incoming request.
 * The identity marker is passed explicitly instead of being looked up from the
 * session while the response is inspected.
 *
 */
class RequestContext {
private:
  drogon::HttpRequestPtr req;
  std::optional<std::string> identity;

public:
  /**
   * @brief Construct a new Request Context object
   *
   * @param req The request, may be null for requests built in tests
   * @param identity Identity marker. Empty or whitespace-only values are
   * stored as absent.
   */
  explicit RequestContext(drogon::HttpRequestPtr req,
                          std::optional<std::string> identity = std::nullopt);

  /**
   * @brief Read the identity marker from the SessionToken stored under
   * sessionKey in the request's session
   *
   * @param req The incoming request
   * @param sessionKey Session entry holding the SessionToken
   * @return RequestContext
   */
  static RequestContext fromRequest(const drogon::HttpRequestPtr &req,
                                    const std::string &sessionKey);

  // Same as fromRequest, with the session given explicitly
  static RequestContext fromSession(const drogon::HttpRequestPtr &req,
                                    const drogon::SessionPtr &sessionPtr,
                                    const std::string &sessionKey);

  const drogon::HttpRequestPtr &request() const { return this->req; }
  const std::optional<std::string> &identityMarker() const {
    return this->identity;
  }
  bool isAuthenticated() const { return this->identity.has_value(); }
};
