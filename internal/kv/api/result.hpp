#pragma once

#include <string>

namespace orchestrator::kv {

/*
  Portable coordination store result codes.

  Backends must translate their native errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,

  // check-and-set index mismatch, or lock held by another session
  Conflict,

  // connectivity / busy / timeout; safe to retry
  Unavailable,

  InvalidArgument,
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

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

} // namespace orchestrator::kv
