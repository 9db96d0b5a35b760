#pragma once

#include <stdexcept>
#include <string>

namespace ledcast::util {

/*
  Central error types.

  The catalog adapter maps these to gRPC status codes; the scheduler
  records them as per-geometry failure reasons.
*/

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CapacityError : public std::runtime_error {
 public:
  explicit CapacityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockContention : public std::runtime_error {
 public:
  explicit LockContention(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StreamIOError : public std::runtime_error {
 public:
  explicit StreamIOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ledcast::util
