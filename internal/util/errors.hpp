#pragma once

#include <stdexcept>
#include <string>

namespace transfer::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Illegal state transition or an operation the current lifecycle does not allow.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised at construction time when required wiring is missing.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  The execution environment itself is compromised.

  Workers stop instead of retrying when they see this.
*/
class FatalError : public std::runtime_error {
 public:
  explicit FatalError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace transfer::util
