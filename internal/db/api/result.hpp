#pragma once

#include <string>
#include <string_view>

namespace bibmirror::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.

  DiskFull is the one code the merge engine treats as a normal stop
  (low disk space) rather than a storage failure.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  Busy,

  ConstraintViolation,
  DiskFull,

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

  bool IsDiskFull() const {
    return code == ErrorCode::DiskFull;
  }
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not-found";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint-violation";
    case ErrorCode::DiskFull:
      return "disk-full";
    case ErrorCode::IOError:
      return "io-error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal-error";
  }
  return "unknown";
}

// "<code>: <message>", for exception and log text.
inline std::string Describe(const Result& r) {
  std::string text(ToString(r.code));
  if (!r.message.empty()) text += ": " + r.message;
  return text;
}

} // namespace bibmirror::db
