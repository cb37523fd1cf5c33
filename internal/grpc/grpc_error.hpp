#pragma once

#include <grpcpp/grpcpp.h>

#include <string>

#include "internal/util/errors.hpp"

namespace syncore::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/
::grpc::Status ToStatus(const std::exception& e);

/*
  Client side: converts a failed status back into the error taxonomy.

  UNAVAILABLE, DEADLINE_EXCEEDED, RESOURCE_EXHAUSTED, ABORTED -> TransientTransportError
  FAILED_PRECONDITION, UNIMPLEMENTED                          -> FatalError
  CANCELLED                                                   -> Cancelled
  anything else                                               -> std::runtime_error
*/
void ThrowIfError(const ::grpc::Status& status, const std::string& action);

} // namespace syncore::grpc
