#include "response.h"
#include <drogon/HttpAppFramework.h>
#include <drogon/HttpViewData.h>
#include <sstream>

using drogon::HttpViewData;

drogon::HttpResponsePtr toError(drogon::HttpStatusCode st, std::string &&msg) {
  auto response = drogon::HttpResponse::newHttpResponse();
  response->setStatusCode(st);
  response->setBody(msg);
  return response;
}

drogon::HttpResponsePtr toDebugPage(drogon::HttpStatusCode st,
                                    const drogon::HttpRequestPtr &req,
                                    const std::string &detail) {
  std::ostringstream page;
  page << "<!DOCTYPE html><html><head><title>" << static_cast<int>(st)
       << " - staging</title></head><body>";
  page << "<h1>" << static_cast<int>(st) << "</h1>";
  page << "<h2>" << HttpViewData::htmlTranslate(detail) << "</h2>";
  if (req) {
    page << "<h3>Request</h3><p>" << req->getMethodString() << " "
         << HttpViewData::htmlTranslate(req->getPath()) << "</p>";
    page << "<h3>Headers</h3><table>";
    for (const auto &[name, value] : req->getHeaders()) {
      page << "<tr><td>" << HttpViewData::htmlTranslate(name) << "</td><td>"
           << HttpViewData::htmlTranslate(value) << "</td></tr>";
    }
    page << "</table>";
  }
  page << "<h3>Routes</h3><table>";
  for (const auto &[path, method, description] :
       drogon::app().getHandlersInfo()) {
    page << "<tr><td>" << HttpViewData::htmlTranslate(path) << "</td><td>"
         << HttpViewData::htmlTranslate(description) << "</td></tr>";
  }
  page << "</table></body></html>";

  auto response = drogon::HttpResponse::newHttpResponse();
  response->setStatusCode(st);
  response->setContentTypeCode(drogon::CT_TEXT_HTML);
  response->setBody(page.str());
  return response;
}
