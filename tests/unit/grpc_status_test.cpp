#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/sync_remote_server.hpp"
#include "internal/remote/remote_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using syncore::grpc::SyncRemoteServer;
using syncore::grpc::ThrowIfError;
using syncore::grpc::ToStatus;

template <typename Error>
bool ThrowsAs(::grpc::StatusCode code) {
  try {
    ThrowIfError(::grpc::Status(code, "boom"), "push");
  } catch (const Error& e) {
    return std::string(e.what()) == "push: boom";
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

void TestExceptionsMapToStatusCodes() {
  using namespace syncore::util;
  assert(ToStatus(ValidationError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(FatalError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(TransientTransportError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(Cancelled("x")).error_code() == ::grpc::StatusCode::CANCELLED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(NotFound("missing op")).error_message() == "missing op");
}

void TestStatusCodesMapBackToErrors() {
  using namespace syncore::util;
  ThrowIfError(::grpc::Status::OK, "push");

  assert(ThrowsAs<TransientTransportError>(::grpc::StatusCode::UNAVAILABLE));
  assert(ThrowsAs<TransientTransportError>(::grpc::StatusCode::DEADLINE_EXCEEDED));
  assert(ThrowsAs<TransientTransportError>(::grpc::StatusCode::RESOURCE_EXHAUSTED));
  assert(ThrowsAs<TransientTransportError>(::grpc::StatusCode::ABORTED));
  assert(ThrowsAs<FatalError>(::grpc::StatusCode::FAILED_PRECONDITION));
  assert(ThrowsAs<FatalError>(::grpc::StatusCode::UNIMPLEMENTED));
  assert(ThrowsAs<Cancelled>(::grpc::StatusCode::CANCELLED));

  // not retried, not fatal
  assert(!ThrowsAs<TransientTransportError>(::grpc::StatusCode::INVALID_ARGUMENT));
  assert(!ThrowsAs<FatalError>(::grpc::StatusCode::INTERNAL));
  assert(ThrowsAs<std::runtime_error>(::grpc::StatusCode::INVALID_ARGUMENT));
}

void TestSchemaMismatchReturnsFailedPrecondition() {
  auto             store = std::make_shared<syncore::remote::RemoteStore>(2);
  SyncRemoteServer server(store);

  syncore::v1::PullRequest  req;
  syncore::v1::PullResponse resp;
  req.set_schema_version(1);
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Pull(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestInvalidCursorReturnsInvalidArgument() {
  auto             store = std::make_shared<syncore::remote::RemoteStore>(1);
  SyncRemoteServer server(store);

  syncore::v1::PullRequest req;
  req.set_schema_version(1);
  req.set_cursor("not-a-cursor");
  syncore::v1::PullResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  const auto status = server.Pull(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestPushWithoutIdReturnsInvalidArgument() {
  auto             store = std::make_shared<syncore::remote::RemoteStore>(1);
  SyncRemoteServer server(store);

  syncore::v1::PushRequest req;
  req.set_schema_version(1);
  req.mutable_operation()->set_target_key("grade/42");
  syncore::v1::PushResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  const auto status = server.Push(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(store->LogSize() == 0);
}

void TestStaleBaseVersionReturnsConflictNotError() {
  auto store = std::make_shared<syncore::remote::RemoteStore>(1);
  syncore::v1::Change existing;
  existing.set_key("grade/42");
  existing.set_value("B");
  existing.set_origin_role("head_teacher");
  store->Write(existing);

  SyncRemoteServer server(store);

  syncore::v1::PushRequest req;
  req.set_schema_version(1);
  auto* op = req.mutable_operation();
  op->set_id("op-1");
  op->set_target_key("grade/42");
  op->set_payload("A");
  op->set_base_version(0);
  syncore::v1::PushResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  const auto status = server.Push(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.has_conflict());
  assert(resp.conflict().remote().value() == "B");
  assert(resp.conflict().remote().version() == 1);

  op->set_base_version(1);
  syncore::v1::PushResponse accepted;
  ::grpc::ServerContext     retry_ctx;
  assert(server.Push(&retry_ctx, &req, &accepted).ok());
  assert(accepted.has_ack());
  assert(accepted.ack().version() == 2);
}

} // namespace

int main() {
  TestExceptionsMapToStatusCodes();
  TestStatusCodesMapBackToErrors();
  TestSchemaMismatchReturnsFailedPrecondition();
  TestInvalidCursorReturnsInvalidArgument();
  TestPushWithoutIdReturnsInvalidArgument();
  TestStaleBaseVersionReturnsConflictNotError();

  std::cout << "grpc_status_test: pass\n";
  return 0;
}
