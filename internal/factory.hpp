#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/service/service_context.hpp"
#include "internal/service/sync_service.hpp"

namespace syncore::remote {
class RemoteEndpoint;
class RemoteStore;
}

namespace syncore::factory {

/*
  Runtime

  Owns all long-lived components of the sync core.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  service::ServiceContext               context;
  std::shared_ptr<service::SyncService> service;

  // set when the remote is the in-process loopback
  std::shared_ptr<remote::RemoteStore> loopback_store;
};

/*
  BuildRuntime

  Constructs the whole sync core from runtime config: opens and recovers the
  operation log, hydrates the cache and wires the coordinator to the
  connectivity monitor.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and remote types.
  A non-null `remote` overrides the configured endpoint.
*/
Runtime BuildRuntime(const syncore::runtime::config::RuntimeConfig& config, std::shared_ptr<remote::RemoteEndpoint> remote = nullptr);

} // namespace syncore::factory
