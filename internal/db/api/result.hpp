#pragma once

#include <string>

namespace registry::db {

/*
  Portable repository result codes.

  Backends translate their native errors (sqlite3 return codes) into
  these. The core maps them onto the registry error
  taxonomy and never sees a backend type.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
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

} // namespace registry::db
