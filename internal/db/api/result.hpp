#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace mc3d::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
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

/*
  Service boundary: non-OK results become exceptions.

    NotFound      -> util::NotFound
    AlreadyExists -> util::AlreadyExists
    anything else -> util::InvalidState
*/
inline void ThrowIfError(const Result& result, const std::string& what) {
  if (result) return;

  const std::string msg = result.message.empty() ? what : what + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    default:
      throw util::InvalidState(msg);
  }
}

} // namespace mc3d::db
