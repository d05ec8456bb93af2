#pragma once

#include <string>

namespace waveq::db {

/*
  Repository outcome codes.

  Backends translate their native errors into these; the request store maps
  NotFound, AlreadyExists and Conflict onto util exceptions and treats the
  rest as internal failures.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

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

} // namespace waveq::db
