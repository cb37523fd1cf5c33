#include "internal/remote/loopback_endpoint.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace syncore::remote {

LoopbackEndpoint::LoopbackEndpoint(std::shared_ptr<RemoteStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("loopback endpoint requires a store");
  }
}

syncore::v1::PullResponse LoopbackEndpoint::Pull(const syncore::v1::PullRequest& request, const util::CancellationToken& token) {
  if (token.IsCancelled()) {
    throw util::Cancelled("pull cancelled");
  }
  return store_->Pull(request);
}

syncore::v1::PushResponse LoopbackEndpoint::Push(const syncore::v1::PushRequest& request, const util::CancellationToken& token) {
  if (token.IsCancelled()) {
    throw util::Cancelled("push cancelled");
  }
  return store_->Push(request);
}

} // namespace syncore::remote
