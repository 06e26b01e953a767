#pragma once

#include <stdexcept>
#include <string>

namespace artifact::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Asynchronous job
  failures never surface as exceptions to the submitting caller; they are
  recorded on the job instead.
*/

// Malformed or unsupported request at submission time.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
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

// Durable write to the version store failed.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Attempted mutation of a job whose state does not permit it.
class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Content generator reported an error or produced nothing usable.
class GenerationFailure : public std::runtime_error {
 public:
  explicit GenerationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace artifact::util
