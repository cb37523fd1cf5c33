#pragma once

#include <memory>

#include "internal/remote/remote_store.hpp"
#include "syncore/v1/remote_service.grpc.pb.h"

namespace syncore::grpc {

/*
  Thin gRPC adapter exposing a RemoteStore as the SyncRemote service.
*/
class SyncRemoteServer final : public syncore::v1::SyncRemote::Service {
 public:
  explicit SyncRemoteServer(std::shared_ptr<syncore::remote::RemoteStore> store);

  ::grpc::Status Pull(::grpc::ServerContext*, const syncore::v1::PullRequest*, syncore::v1::PullResponse*) override;
  ::grpc::Status Push(::grpc::ServerContext*, const syncore::v1::PushRequest*, syncore::v1::PushResponse*) override;

 private:
  std::shared_ptr<syncore::remote::RemoteStore> store_;
};

} // namespace syncore::grpc
