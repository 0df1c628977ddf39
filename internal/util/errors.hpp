#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace treasury::util {

/*
  Central error types.

  Every ledger failure is a LedgerError carrying its kind, so callers can
  tell failures apart without parsing messages. These get translated later
  to gRPC status codes.
*/

enum class ErrorKind {
  kInsufficientCollateral,
  kInsufficientSupply,
  kEmptyCollateralPool,
  kExcessiveReduction,
  kPaused,
  kUnauthorized,
  kInsufficientBalance,
  kArithmeticOverflow,
  kInvalidArgument,
  kNotFound,
  kAlreadyExists,
  kConflict,
};

class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Would-be state violates the minimum collateralization ratio.
class InsufficientCollateral : public LedgerError {
 public:
  explicit InsufficientCollateral(const std::string& msg) : LedgerError(ErrorKind::kInsufficientCollateral, msg) {
  }
};

// Burn exceeds circulating supply.
class InsufficientSupply : public LedgerError {
 public:
  explicit InsufficientSupply(const std::string& msg) : LedgerError(ErrorKind::kInsufficientSupply, msg) {
  }
};

class EmptyCollateralPool : public LedgerError {
 public:
  explicit EmptyCollateralPool(const std::string& msg) : LedgerError(ErrorKind::kEmptyCollateralPool, msg) {
  }
};

class ExcessiveReduction : public LedgerError {
 public:
  explicit ExcessiveReduction(const std::string& msg) : LedgerError(ErrorKind::kExcessiveReduction, msg) {
  }
};

class Paused : public LedgerError {
 public:
  explicit Paused(const std::string& msg) : LedgerError(ErrorKind::kPaused, msg) {
  }
};

class Unauthorized : public LedgerError {
 public:
  explicit Unauthorized(const std::string& msg) : LedgerError(ErrorKind::kUnauthorized, msg) {
  }
};

// Holder presented or transferred more units than it holds.
class InsufficientBalance : public LedgerError {
 public:
  explicit InsufficientBalance(const std::string& msg) : LedgerError(ErrorKind::kInsufficientBalance, msg) {
  }
};

class ArithmeticOverflow : public LedgerError {
 public:
  explicit ArithmeticOverflow(const std::string& msg) : LedgerError(ErrorKind::kArithmeticOverflow, msg) {
  }
};

class InvalidArgument : public LedgerError {
 public:
  explicit InvalidArgument(const std::string& msg) : LedgerError(ErrorKind::kInvalidArgument, msg) {
  }
};

class NotFound : public LedgerError {
 public:
  explicit NotFound(const std::string& msg) : LedgerError(ErrorKind::kNotFound, msg) {
  }
};

class AlreadyExists : public LedgerError {
 public:
  explicit AlreadyExists(const std::string& msg) : LedgerError(ErrorKind::kAlreadyExists, msg) {
  }
};

// Optimistic version check failed at commit.
class Conflict : public LedgerError {
 public:
  explicit Conflict(const std::string& msg) : LedgerError(ErrorKind::kConflict, msg) {
  }
};

inline std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInsufficientCollateral:
      return "InsufficientCollateral";
    case ErrorKind::kInsufficientSupply:
      return "InsufficientSupply";
    case ErrorKind::kEmptyCollateralPool:
      return "EmptyCollateralPool";
    case ErrorKind::kExcessiveReduction:
      return "ExcessiveReduction";
    case ErrorKind::kPaused:
      return "Paused";
    case ErrorKind::kUnauthorized:
      return "Unauthorized";
    case ErrorKind::kInsufficientBalance:
      return "InsufficientBalance";
    case ErrorKind::kArithmeticOverflow:
      return "ArithmeticOverflow";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kAlreadyExists:
      return "AlreadyExists";
    case ErrorKind::kConflict:
      return "Conflict";
  }
  return "Unknown";
}

} // namespace treasury::util
