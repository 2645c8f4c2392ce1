#pragma once

#include <stdexcept>
#include <string>

namespace chatwire {

class exception : public std::runtime_error {
public:
  explicit exception(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * Failures caused by the environment rather than by the shape of a value,
 * e.g. a response body that is not JSON at all.
 */
class runtime_error : public exception {
public:
  explicit runtime_error(const std::string &message) : exception(message) {}
};

} // namespace chatwire
