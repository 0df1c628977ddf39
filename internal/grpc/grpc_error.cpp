#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace treasury::grpc {

namespace {

::grpc::StatusCode CodeFor(treasury::util::ErrorKind kind) {
  using treasury::util::ErrorKind;

  switch (kind) {
    case ErrorKind::kInsufficientCollateral:
    case ErrorKind::kInsufficientSupply:
    case ErrorKind::kEmptyCollateralPool:
    case ErrorKind::kInsufficientBalance:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case ErrorKind::kPaused:
      return ::grpc::StatusCode::UNAVAILABLE;
    case ErrorKind::kUnauthorized:
      return ::grpc::StatusCode::PERMISSION_DENIED;
    case ErrorKind::kExcessiveReduction:
    case ErrorKind::kInvalidArgument:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case ErrorKind::kArithmeticOverflow:
      return ::grpc::StatusCode::OUT_OF_RANGE;
    case ErrorKind::kNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case ErrorKind::kAlreadyExists:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    case ErrorKind::kConflict:
      return ::grpc::StatusCode::ABORTED;
  }
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* ledger_error = dynamic_cast<const treasury::util::LedgerError*>(&e)) {
    return {CodeFor(ledger_error->Kind()), e.what(), std::string(treasury::util::ErrorKindName(ledger_error->Kind()))};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace treasury::grpc
