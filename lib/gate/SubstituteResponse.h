#pragma once
#include <drogon/HttpResponse.h>
#include <string>

/**
 * @brief Builds the fixed response returned in place of a hidden one. The
 * only data taken over from the hidden response is its numeric status code.
 *
 */
class SubstituteResponse {
private:
  int status;
  std::string contentType;
  std::string bodyTemplate;

public:
  static constexpr const char *placeholder = "{status}";

  SubstituteResponse(int status, std::string contentType,
                     std::string bodyTemplate);

  /**
   * @brief Render the body template, replacing every "{status}" with the
   * hidden status code
   *
   * @param originalStatus Status code of the hidden response
   * @return std::string
   */
  std::string render(int originalStatus) const;

  /**
   * @brief Create a new response carrying the configured status, content type
   * and rendered body. No other header is set.
   *
   * @param originalStatus Status code of the hidden response
   * @return drogon::HttpResponsePtr
   */
  drogon::HttpResponsePtr build(int originalStatus) const;
};
