#pragma once

#include <memory>

namespace syncore::db { class Repository; }
namespace syncore::events { class EventBus; }
namespace syncore::oplog { class OperationLog; }
namespace syncore::cache { class CacheStore; }
namespace syncore::policy { class PolicyGate; }
namespace syncore::conflict { class ConflictResolver; class ConflictLedger; }
namespace syncore::sync { class SyncCoordinator; }
namespace syncore::connectivity { class ConnectivityMonitor; }

namespace syncore::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<syncore::db::Repository> repository;
  std::shared_ptr<syncore::events::EventBus> events;
  std::shared_ptr<syncore::oplog::OperationLog> oplog;
  std::shared_ptr<syncore::cache::CacheStore> cache;
  std::shared_ptr<syncore::policy::PolicyGate> gate;
  std::shared_ptr<syncore::conflict::ConflictResolver> resolver;
  std::shared_ptr<syncore::conflict::ConflictLedger> ledger;
  std::shared_ptr<syncore::sync::SyncCoordinator> coordinator;
  std::shared_ptr<syncore::connectivity::ConnectivityMonitor> monitor;
};

}
