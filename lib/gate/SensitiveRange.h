#pragma once
#include <ConfigurationError.h>

/**
 * @brief Closed interval of HTTP status codes considered too revealing to
 * show an unauthenticated caller.
 *
 */
class SensitiveRange {
private:
  int lowerBound;
  int upperBound;

public:
  /**
   * @brief Construct a new Sensitive Range object
   *
   * @param low Lowest status code in the range (inclusive)
   * @param high Highest status code in the range (inclusive)
   * @throws ConfigurationError if low > high
   */
  explicit SensitiveRange(int low = 400, int high = 599);

  bool contains(int status) const;
  int low() const { return this->lowerBound; }
  int high() const { return this->upperBound; }
};
