#pragma once

#include <stdexcept>
#include <string>

namespace vaultd::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Permission level too low, path outside the sandbox, command not allowlisted,
// suspicious argument. Never retried.
class AccessDenied : public std::runtime_error {
 public:
  explicit AccessDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Language model unreachable, misconfigured or returned an unusable response.
class ModelError : public std::runtime_error {
 public:
  explicit ModelError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace vaultd::util
