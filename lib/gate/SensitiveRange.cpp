#include "SensitiveRange.h"
#include <string>

SensitiveRange::SensitiveRange(int low, int high)
    : lowerBound{low}, upperBound{high} {
  if (low > high) {
    throw ConfigurationError{"Invalid sensitive range: lower bound " +
                             std::to_string(low) +
                             " is greater than upper bound " +
                             std::to_string(high)};
  }
}

bool SensitiveRange::contains(int status) const {
  return status >= this->lowerBound && status <= this->upperBound;
}
