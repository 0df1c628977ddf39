#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace treasury::db {

/*
  Outcome of a single repository write.

  Backends translate their native failures into these codes; LedgerManager
  turns anything but OK into a ledger error. Conflict means the stored
  ledger version was not the one the caller loaded.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // ledger row missing
  AlreadyExists, // ledger id taken
  Conflict,      // version check failed
  Busy,          // backend lock timeout

  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

struct [[nodiscard]] Result {
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

} // namespace treasury::db
