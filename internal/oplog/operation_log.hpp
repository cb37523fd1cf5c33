#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "syncore/v1/operation.pb.h"
#include "syncore/v1/status.pb.h"

namespace syncore::events {
class EventBus;
}

namespace syncore::oplog {

enum class AckOutcome {
  kCompleted,
  kConflicted,
  kFailed,
};

struct OperationLogOptions {
  uint32_t     max_operations      = 1000;
  uint32_t     checkpoint_every    = 256;
  util::Millis default_ttl{0};
  uint32_t     completed_retention = 4096;
};

/*
  Durable, priority-ordered log of pending local changes.

  Write-ahead: every mutation is appended to the journal and committed before
  it becomes visible to readers. Order is (priority, enqueue_seq), so FIFO
  holds within a tier.

  Concurrency: one writer at a time (writer_mutex_); readers take a shared
  lock on the in-memory view and never observe uncommitted state.

  Lifecycle: Queued -> Admitted -> InFlight -> {Completed | Conflicted | Failed}.
  Completed and Failed operations leave the log and are remembered as
  tombstones so a re-enqueue of the same id is a no-op. Past
  completed_retention, tombstones shrink to id fingerprints.
*/
class OperationLog {
 public:
  // nullopt admits the operation, a time point defers it until then.
  using AdmissionCheck = std::function<std::optional<util::TimePoint>(const syncore::v1::Operation&)>;
  // Runs inside the journal transaction of an ack.
  using TxHook  = std::function<void(db::Transaction&)>;
  using Amender = std::function<void(syncore::v1::Operation&)>;

  OperationLog(std::shared_ptr<db::Repository> repository, OperationLogOptions options, std::shared_ptr<events::EventBus> events = nullptr);

  // Rebuilds the in-memory view from the last checkpoint plus the journal tail.
  // States are restored exactly as they were persisted.
  void Open();

  // Startup recovery: Admitted/InFlight operations return to Queued with one
  // more attempt counted. Returns the ids that were reverted.
  std::vector<std::string> Recover();

  // Returns the operation id. Re-enqueueing a live id merges into it;
  // re-enqueueing a terminal id is a no-op.
  std::string Enqueue(syncore::v1::Operation op);

  // Ready operations in strict priority order, FIFO within a tier. Returned
  // operations are moved to Admitted. Deferred operations get scheduled_for_ms
  // and stay Queued.
  std::vector<syncore::v1::Operation> DequeueReady(size_t max, util::TimePoint now, const AdmissionCheck& admit = {});

  // Admitted -> InFlight; counts one transmission attempt.
  syncore::v1::Operation MarkInFlight(const std::string& id);

  // Another transmission attempt of an InFlight operation.
  syncore::v1::Operation RecordRetry(const std::string& id, const std::string& error);

  void Ack(const std::string& id, AckOutcome outcome, const std::string& reason = {}, const TxHook& hook = {});

  // Admitted/InFlight/Conflicted -> Queued. The amender may rebase the change.
  void Requeue(const std::string& id, const std::string& reason, const Amender& amend = {}, const TxHook& hook = {});

  // Rewrites payload/base_version of a live operation without changing state.
  void Amend(const std::string& id, const Amender& amend, const TxHook& hook = {});

  // Only effective while Queued (deferred included).
  bool Cancel(const std::string& id);

  std::optional<syncore::v1::Operation> Get(const std::string& id) const;
  std::optional<syncore::v1::Tombstone> GetTombstone(const std::string& id) const;
  std::vector<syncore::v1::Operation>   ListOperations() const;
  syncore::v1::QueueSnapshot            PeekStatus(util::TimePoint now = util::Now()) const;

  // Snapshot + journal truncation in one transaction.
  void Checkpoint();

 private:
  using OrderKey = std::pair<int, uint64_t>;

  struct Change {
    std::optional<syncore::v1::Operation> upsert;
    std::optional<syncore::v1::Tombstone> remove;
  };

  static OrderKey Key(const syncore::v1::Operation& op);

  // Journals the changes (plus hook) in one transaction, then applies them.
  void Commit(const std::vector<Change>& changes, const TxHook& hook = {});
  void Apply(const Change& change);
  void CheckpointLocked();
  void PruneTombstonesLocked();
  std::optional<syncore::v1::OperationState> TerminalOutcomeLocked(const std::string& id) const;

  syncore::v1::Operation RequireLive(const std::string& id) const;
  syncore::v1::Tombstone MakeTombstone(const syncore::v1::Operation& op, syncore::v1::OperationState outcome, const std::string& reason) const;

  void PublishQueueChanged();
  void PublishFailed(const syncore::v1::Operation& op, const std::string& reason);

  std::shared_ptr<db::Repository>   repository_;
  OperationLogOptions               options_;
  std::shared_ptr<events::EventBus> events_;

  std::mutex writer_mutex_;

  mutable std::shared_mutex                                       mutex_;
  std::unordered_map<std::string, syncore::v1::Operation>        live_;
  std::map<OrderKey, std::string>                                 order_;
  std::unordered_map<std::string, syncore::v1::Tombstone>        tombstones_;
  std::deque<std::string>                                         tombstone_order_;
  std::unordered_map<uint64_t, syncore::v1::OperationState>      retired_;
  uint64_t                                                        next_enqueue_seq_ = 1;
  uint64_t                                                        last_seq_         = 0;
  uint64_t                                                        completed_total_  = 0;
  uint64_t                                                        failed_total_     = 0;
  uint32_t                                                        appends_since_checkpoint_ = 0;
  bool                                                            opened_ = false;
};

} // namespace syncore::oplog
