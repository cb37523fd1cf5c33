#pragma once

#include "internal/util/cancellation.hpp"
#include "syncore/v1/remote_service.pb.h"

namespace syncore::remote {

/*
  Abstract remote system that accepts pushes and serves deltas.

  Implementations throw from util/errors.hpp:
    TransientTransportError  retryable transport failure
    FatalError               schema/version mismatch
    Cancelled                the token fired
  Any other std::exception is a non-retryable rejection of the request.
*/
class RemoteEndpoint {
 public:
  virtual ~RemoteEndpoint() = default;

  virtual syncore::v1::PullResponse Pull(const syncore::v1::PullRequest& request, const util::CancellationToken& token) = 0;
  virtual syncore::v1::PushResponse Push(const syncore::v1::PushRequest& request, const util::CancellationToken& token) = 0;
};

} // namespace syncore::remote
