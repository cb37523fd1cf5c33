#include "internal/remote/grpc_remote_endpoint.hpp"

#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace syncore::remote {

GrpcRemoteEndpoint::GrpcRemoteEndpoint(std::shared_ptr<::grpc::Channel> channel, util::Millis timeout)
    : stub_(syncore::v1::SyncRemote::NewStub(std::move(channel))), timeout_(timeout) {
}

std::shared_ptr<GrpcRemoteEndpoint> GrpcRemoteEndpoint::Connect(const std::string& target, bool insecure, util::Millis timeout) {
  auto credentials = insecure ? ::grpc::InsecureChannelCredentials() : ::grpc::SslCredentials(::grpc::SslCredentialsOptions());
  return std::make_shared<GrpcRemoteEndpoint>(::grpc::CreateChannel(target, credentials), timeout);
}

void GrpcRemoteEndpoint::Prepare(::grpc::ClientContext& context) const {
  context.set_deadline(std::chrono::system_clock::now() + timeout_);
}

syncore::v1::PullResponse GrpcRemoteEndpoint::Pull(const syncore::v1::PullRequest& request, const util::CancellationToken& token) {
  if (token.IsCancelled()) {
    throw util::Cancelled("pull cancelled");
  }

  ::grpc::ClientContext context;
  Prepare(context);
  util::CancellationRegistration registration(token, [&context] { context.TryCancel(); });

  syncore::v1::PullResponse response;
  syncore::grpc::ThrowIfError(stub_->Pull(&context, request, &response), "pull");
  return response;
}

syncore::v1::PushResponse GrpcRemoteEndpoint::Push(const syncore::v1::PushRequest& request, const util::CancellationToken& token) {
  if (token.IsCancelled()) {
    throw util::Cancelled("push cancelled");
  }

  ::grpc::ClientContext context;
  Prepare(context);
  util::CancellationRegistration registration(token, [&context] { context.TryCancel(); });

  syncore::v1::PushResponse response;
  syncore::grpc::ThrowIfError(stub_->Push(&context, request, &response), "push " + request.operation().id());
  return response;
}

} // namespace syncore::remote
