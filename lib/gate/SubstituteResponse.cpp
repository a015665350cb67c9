#include "SubstituteResponse.h"

SubstituteResponse::SubstituteResponse(int status, std::string contentType,
                                       std::string bodyTemplate)
    : status{status}, contentType{std::move(contentType)},
      bodyTemplate{std::move(bodyTemplate)} {}

std::string SubstituteResponse::render(int originalStatus) const {
  const auto token = std::string{placeholder};
  const auto code = std::to_string(originalStatus);
  auto body = this->bodyTemplate;
  for (auto pos = body.find(token); pos != std::string::npos;
       pos = body.find(token, pos + code.size())) {
    body.replace(pos, token.size(), code);
  }
  return body;
}

drogon::HttpResponsePtr SubstituteResponse::build(int originalStatus) const {
  auto response = drogon::HttpResponse::newHttpResponse();
  response->setStatusCode(static_cast<drogon::HttpStatusCode>(this->status));
  response->setContentTypeString(this->contentType);
  response->setBody(this->render(originalStatus));
  return response;
}
