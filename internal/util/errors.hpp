#pragma once

#include <stdexcept>
#include <string>

namespace pwaudit::util {

/*
  Central error types.

  Snapshot errors are turned into the Error outcome by the decision engine.
  Config errors are fatal and surface as a non-zero exit code.
*/

class SnapshotUnavailable : public std::runtime_error {
 public:
  explicit SnapshotUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SnapshotParseError : public std::runtime_error {
 public:
  explicit SnapshotParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace pwaudit::util
