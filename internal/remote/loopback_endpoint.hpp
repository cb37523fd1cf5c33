#pragma once

#include <memory>

#include "internal/remote/remote_endpoint.hpp"
#include "internal/remote/remote_store.hpp"

namespace syncore::remote {

/*
  In-process endpoint over a RemoteStore. Used when no remote is configured
  and by tests.
*/
class LoopbackEndpoint : public RemoteEndpoint {
 public:
  explicit LoopbackEndpoint(std::shared_ptr<RemoteStore> store);

  syncore::v1::PullResponse Pull(const syncore::v1::PullRequest& request, const util::CancellationToken& token) override;
  syncore::v1::PushResponse Push(const syncore::v1::PushRequest& request, const util::CancellationToken& token) override;

  const std::shared_ptr<RemoteStore>& Store() const {
    return store_;
  }

 private:
  std::shared_ptr<RemoteStore> store_;
};

} // namespace syncore::remote
