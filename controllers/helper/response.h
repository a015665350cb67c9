#pragma once
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <string>

drogon::HttpResponsePtr toError(drogon::HttpStatusCode st, std::string &&msg);

/**
 * @brief Render the verbose staging error page: request line, request
 * headers, the error detail and the table of registered handlers.
 *
 * Everything on this page is meant for developers. Unauthenticated callers
 * only get to see it when its status is outside the gate's sensitive range.
 *
 * @param st Status code of the page
 * @param req The request that failed
 * @param detail Error message or exception text
 * @return drogon::HttpResponsePtr
 */
drogon::HttpResponsePtr toDebugPage(drogon::HttpStatusCode st,
                                    const drogon::HttpRequestPtr &req,
                                    const std::string &detail);
