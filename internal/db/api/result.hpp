#pragma once

#include <string>

namespace tables::db {

/*
  Repository outcome codes.

  Backends translate their native failures into these; services turn the
  non-OK ones into util exceptions. ManualAdjustmentService also hands
  Conflict back to its caller as a rejected edit.
*/

enum class ErrorCode {
  OK = 0,

  // missing tournament, table, allocation or audit target
  NotFound,
  // duplicate terrain name or table number
  AlreadyExists,
  // stale allocation version, or a table already held in the round
  Conflict,
  // another connection holds the write lock
  Busy,

  // unknown terrain type or tournament on a table, orphan audit entry
  ConstraintViolation,

  // sqlite file could not be read or written, or failed its checks
  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:                  return "ok";
    case ErrorCode::NotFound:            return "not_found";
    case ErrorCode::AlreadyExists:       return "already_exists";
    case ErrorCode::Conflict:            return "conflict";
    case ErrorCode::Busy:                return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::IOError:             return "io_error";
    case ErrorCode::Corruption:          return "corruption";
    case ErrorCode::InternalError:       return "internal_error";
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

} // namespace tables::db
