#pragma once

#include <string>

namespace settle::db {

// Outcome of a single repository write. Backends map their native failures
// (sqlite3 result codes, pqxx exception types) onto these codes so that the
// store and the managers above it stay backend-agnostic.
enum class ErrorCode {
  OK = 0,

  NotFound,      // update/delete of an id that is not open
  AlreadyExists, // duplicate item id, terminal id or live reservation key

  ConstraintViolation,
  SerializationFailure, // postgres aborted the transaction; retry the pass
  Busy,                 // sqlite lock wait exceeded busy_timeout

  IOError,
  Corruption,
  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }
  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // "<code>: <message>" for log lines and exception text.
  std::string Describe() const {
    if (message.empty()) return ToString(code);
    return std::string(ToString(code)) + ": " + message;
  }
};

} // namespace settle::db
