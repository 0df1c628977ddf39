#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace treasury::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Ledger errors also carry their kind name in error_details so callers can
  tell apart failures that share a status code.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace treasury::grpc
