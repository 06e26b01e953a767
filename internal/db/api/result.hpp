#pragma once

#include <string>

namespace artifact::db {

/*
  Backend-neutral outcome of a repository write.

  Each backend translates its own failures (sqlite return codes, pqxx
  exceptions, filesystem errors) into these codes. The version store turns
  any non-OK result into util::StoreUnavailable.
*/

enum class ErrorCode {
  OK = 0,

  // (artifact_id, version) already present
  AlreadyExists,
  ConstraintViolation,

  Busy,
  SerializationFailure,

  IOError,
  Corruption,

  // artifact id the backend cannot represent
  Unsupported,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace artifact::db
