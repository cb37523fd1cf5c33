#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"
#include "internal/policy/policy_context.hpp"
#include "internal/sync/circuit_breaker.hpp"
#include "internal/sync/push_worker.hpp"
#include "internal/sync/retry_policy.hpp"
#include "internal/util/cancellation.hpp"
#include "syncore/v1/change.pb.h"
#include "syncore/v1/conflict.pb.h"
#include "syncore/v1/status.pb.h"

namespace syncore::db {
class Repository;
}
namespace syncore::oplog {
class OperationLog;
}
namespace syncore::cache {
class CacheStore;
}
namespace syncore::policy {
class PolicyGate;
}
namespace syncore::conflict {
class ConflictResolver;
class ConflictLedger;
}
namespace syncore::remote {
class RemoteEndpoint;
}
namespace syncore::events {
class EventBus;
}

namespace syncore::sync {

struct SyncCoordinatorOptions {
  uint32_t                                       max_batch       = 50;
  uint32_t                                       max_concurrency = 4;
  uint32_t                                       schema_version  = 1;
  uint32_t                                       pull_page_size  = 200;
  syncore::runtime::config::RetryConfig          retry;
  syncore::runtime::config::CircuitBreakerConfig circuit_breaker;

  static SyncCoordinatorOptions FromConfig(const syncore::runtime::config::SyncConfig& config);
};

/*
  Runs sync sessions.

  Idle -> PullingDelta -> Reconciling -> PushingOperations -> Completed | PartialFailure

  - Pulled pages are merged into the cache and the cursor advanced in one
    transaction, page by page.
  - Queued operations whose target key moved remotely are reconciled through
    the resolver; manual outcomes park them as Conflicted.
  - Admitted operations are pushed tier by tier (priority order) by a bounded
    worker pool. Transient failures back off and retry up to the limit; a
    failure streak opens the breaker, which suspends pushes but not pulls.

  One session at a time: a concurrent request returns SKIPPED. A paused queue
  skips the push phase only.
*/
class SyncCoordinator : public PushExecutor {
 public:
  using ContextProvider = std::function<policy::PolicyContext()>;

  static constexpr const char* kCursorKey      = "cursor";
  static constexpr const char* kQueuePausedKey = "queue_paused";

  SyncCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<oplog::OperationLog> oplog,
                  std::shared_ptr<cache::CacheStore> cache, std::shared_ptr<policy::PolicyGate> gate,
                  std::shared_ptr<conflict::ConflictResolver> resolver, std::shared_ptr<conflict::ConflictLedger> ledger,
                  std::shared_ptr<remote::RemoteEndpoint> remote, SyncCoordinatorOptions options,
                  std::shared_ptr<events::EventBus> events = nullptr);
  ~SyncCoordinator() override;

  SyncCoordinator(const SyncCoordinator&)            = delete;
  SyncCoordinator& operator=(const SyncCoordinator&) = delete;

  void SetContextProvider(ContextProvider provider);

  syncore::v1::SyncOutcome RunSession(std::optional<uint32_t> max_batch = std::nullopt);

  // Cancels the running session, if any.
  bool CancelSession();

  // Manual decision for a parked conflict.
  syncore::v1::Resolution ResolveConflict(const std::string& conflict_id, syncore::v1::ResolutionKind kind,
                                          const std::string& merged_value = {});

  // Persisted pause of the push side; pulls keep running.
  void SetQueuePaused(bool paused);
  bool QueuePaused() const;

  std::string               Cursor() const;
  syncore::v1::BreakerState Breaker() const;

  void ExecutePush(const PushTask& task) override;

 private:
  void     Transmit(const PushTask& task);
  // Adds merged changes to `pulled` page by page, so a failed page keeps the
  // count of the pages before it.
  void     PullDelta(const util::CancellationToken& token, std::unordered_map<std::string, syncore::v1::Change>& touched,
                     uint32_t& pulled);
  void     Reconcile(const std::unordered_map<std::string, syncore::v1::Change>& touched, SessionCounters& counters);
  void     PushOperations(uint32_t max_batch, const policy::PolicyContext& context, const util::CancellationToken& token,
                          const std::shared_ptr<SessionCounters>& counters);

  syncore::v1::Conflict BuildConflict(const syncore::v1::Operation& op, const syncore::v1::Change& remote) const;

  // Returns the rebased operation when it should be pushed again.
  std::optional<syncore::v1::Operation> ApplyResolution(const syncore::v1::Operation& op, const syncore::v1::Change& remote,
                                                        syncore::v1::Conflict conflict, const syncore::v1::Resolution& resolution,
                                                        bool in_flight);

  void Complete(const syncore::v1::Operation& op, uint64_t version);
  void Requeue(const syncore::v1::Operation& op, const std::string& reason, SessionCounters& counters);

  void PublishSession(syncore::v1::EventType type, const syncore::v1::SyncOutcome& outcome) const;

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<oplog::OperationLog>        oplog_;
  std::shared_ptr<cache::CacheStore>          cache_;
  std::shared_ptr<policy::PolicyGate>         gate_;
  std::shared_ptr<conflict::ConflictResolver> resolver_;
  std::shared_ptr<conflict::ConflictLedger>   ledger_;
  std::shared_ptr<remote::RemoteEndpoint>     remote_;
  SyncCoordinatorOptions                      options_;
  std::shared_ptr<events::EventBus>           events_;

  RetryPolicy    retry_;
  CircuitBreaker breaker_;

  std::mutex      context_mutex_;
  ContextProvider context_provider_;

  std::mutex                                session_mutex_;
  std::mutex                                source_mutex_;
  std::shared_ptr<util::CancellationSource> source_;

  std::shared_ptr<TaskChannel<PushTask>> channel_;
  std::unique_ptr<PushWorkerPool>        workers_;
};

} // namespace syncore::sync
