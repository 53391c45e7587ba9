#pragma once

#include <string>
#include <utility>

namespace twiper::dedup {

/*
  Portable store result codes.

  Store backends translate their native errors into these.
  Upper layers never depend on sqlite or filesystem error types.
*/

enum class ErrorCode {
  OK = 0,

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

const char* ErrorCodeName(ErrorCode code);

} // namespace twiper::dedup
