#pragma once

#include <stdexcept>
#include <string>

namespace rdash::util {

/*
  Central error types.

  ConfigError is fatal at startup. The remote layer reports its failures
  as values (see model/remote_error.hpp) and only the one-shot CLI path
  turns them into RemoteFailure.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace rdash::util
