#pragma once

#include <stdexcept>
#include <string>

namespace streamlift::util {

/*
  Central error types.

  Job-level handling keys off these; the gRPC layer translates them to status codes.
*/

// Unsupported format, missing source, unknown media. Never retried.
class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Network timeouts, remote write failures, transcoder crashes.
class TransientIoError : public std::runtime_error {
 public:
  explicit TransientIoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CredentialExpired : public TransientIoError {
 public:
  explicit CredentialExpired(const std::string& msg) : TransientIoError(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace streamlift::util
