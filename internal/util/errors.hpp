#pragma once

#include <stdexcept>
#include <string>

namespace twiper::util {

/*
  Central error types.

  Startup code treats ConfigurationError and StoreError as fatal.
  The orchestrator isolates everything else to the failing candidate.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransientNetworkError : public std::runtime_error {
 public:
  explicit TransientNetworkError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProcessingFailure : public std::runtime_error {
 public:
  explicit ProcessingFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SourceError : public std::runtime_error {
 public:
  explicit SourceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace twiper::util
