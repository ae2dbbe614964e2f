#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace eryzaa::util {

/*
  Central error types.

  Discovery errors stay inside the background loops; access errors are
  surfaced to the caller and translated to gRPC status codes at the helper
  boundary.
*/

class BindError : public std::runtime_error {
 public:
  explicit BindError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PeerTimeout : public std::runtime_error {
 public:
  explicit PeerTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Slot already taken; the caller may retry once the current lease ends.
class ExclusivityViolation : public std::runtime_error {
 public:
  explicit ExclusivityViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ServiceUnavailable : public std::runtime_error {
 public:
  explicit ServiceUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CommandFailure : public std::runtime_error {
 public:
  CommandFailure(const std::string& msg, int exit_code = -1, std::string diagnostics = {})
      : std::runtime_error(msg), exit_code_(exit_code), diagnostics_(std::move(diagnostics)) {
  }

  int exit_code() const noexcept {
    return exit_code_;
  }

  const std::string& diagnostics() const noexcept {
    return diagnostics_;
  }

 private:
  int         exit_code_;
  std::string diagnostics_;
};

class UserNotFound : public std::runtime_error {
 public:
  explicit UserNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace eryzaa::util
