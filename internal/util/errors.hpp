#pragma once

#include <stdexcept>
#include <string>

namespace stackctl::util {

/*
  Central error types.

  Commands translate these into process exit codes at main().
  Expected-absence conditions and races are never thrown; they are
  logged where they happen.
*/

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A required input (source file, artifact, stopped stack) is missing.
class PreconditionFailed : public std::runtime_error {
 public:
  explicit PreconditionFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExportFailed : public std::runtime_error {
 public:
  explicit ExportFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RestoreFailed : public std::runtime_error {
 public:
  explicit RestoreFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class VersionConflict : public std::runtime_error {
 public:
  explicit VersionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unsupported : public std::runtime_error {
 public:
  explicit Unsupported(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace stackctl::util
