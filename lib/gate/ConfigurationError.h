#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Raised at startup when the gate configuration is unusable
 * (inverted range, wrong value type, out-of-range status code).
 */
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &msg)
      : std::invalid_argument{msg} {}
};
