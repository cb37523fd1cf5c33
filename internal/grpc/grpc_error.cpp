#include "internal/grpc/grpc_error.hpp"

namespace syncore::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace syncore::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const FatalError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const TransientTransportError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const Cancelled*>(&e)) {
    return {::grpc::StatusCode::CANCELLED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status, const std::string& action) {
  using namespace syncore::util;

  if (status.ok()) {
    return;
  }

  const std::string message = action + ": " + status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
    case ::grpc::StatusCode::ABORTED:
      throw TransientTransportError(message);
    case ::grpc::StatusCode::FAILED_PRECONDITION:
    case ::grpc::StatusCode::UNIMPLEMENTED:
      throw FatalError(message);
    case ::grpc::StatusCode::CANCELLED:
      throw Cancelled(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace syncore::grpc
