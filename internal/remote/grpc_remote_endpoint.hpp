#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "internal/remote/remote_endpoint.hpp"
#include "internal/util/time.hpp"
#include "syncore/v1/remote_service.grpc.pb.h"

namespace syncore::remote {

/*
  SyncRemote client. Every call carries a deadline and is cancelled through
  ClientContext::TryCancel when the session token fires.
*/
class GrpcRemoteEndpoint : public RemoteEndpoint {
 public:
  GrpcRemoteEndpoint(std::shared_ptr<::grpc::Channel> channel, util::Millis timeout);

  static std::shared_ptr<GrpcRemoteEndpoint> Connect(const std::string& target, bool insecure, util::Millis timeout);

  syncore::v1::PullResponse Pull(const syncore::v1::PullRequest& request, const util::CancellationToken& token) override;
  syncore::v1::PushResponse Push(const syncore::v1::PushRequest& request, const util::CancellationToken& token) override;

 private:
  void Prepare(::grpc::ClientContext& context) const;

  std::unique_ptr<syncore::v1::SyncRemote::Stub> stub_;
  util::Millis                                   timeout_;
};

} // namespace syncore::remote
