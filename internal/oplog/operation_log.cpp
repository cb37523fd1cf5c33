#include "internal/oplog/operation_log.hpp"

#include <algorithm>
#include <limits>
#include <unordered_set>

#include "internal/events/event_bus.hpp"
#include "internal/model/priority.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace syncore::oplog {

using namespace syncore::v1;

namespace {

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

// Stable 64-bit FNV-1a over the id; identifies pruned tombstones.
uint64_t Fingerprint(const std::string& id) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : id) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

void ParseOrThrow(google::protobuf::MessageLite& message, const std::string& body, const char* what) {
  if (!message.ParseFromString(body)) {
    throw std::runtime_error(std::string("operation log: corrupt ") + what);
  }
}

} // namespace

OperationLog::OperationLog(std::shared_ptr<db::Repository> repository, OperationLogOptions options, std::shared_ptr<events::EventBus> events)
    : repository_(std::move(repository)), options_(options), events_(std::move(events)) {
  if (!repository_) {
    throw std::invalid_argument("operation log requires a repository");
  }
}

OperationLog::OrderKey OperationLog::Key(const Operation& op) {
  return {static_cast<int>(op.priority()), op.enqueue_seq()};
}

// ------------------------------------------------------------
// Replay
// ------------------------------------------------------------

void OperationLog::Open() {
  std::lock_guard<std::mutex> writer(writer_mutex_);

  auto tx         = repository_->Begin();
  auto checkpoint = repository_->GetCheckpoint(*tx);

  OperationCheckpoint snapshot;
  if (checkpoint) {
    ParseOrThrow(snapshot, checkpoint->body, "checkpoint");
  }
  const uint64_t after   = checkpoint ? checkpoint->last_seq : 0;
  auto           journal = repository_->ReadJournal(*tx, after);
  tx->Commit();

  std::unique_lock lock(mutex_);
  live_.clear();
  order_.clear();
  tombstones_.clear();
  tombstone_order_.clear();
  retired_.clear();

  last_seq_         = after;
  next_enqueue_seq_ = std::max<uint64_t>(1, snapshot.next_enqueue_seq());
  completed_total_  = snapshot.completed_total();
  failed_total_     = snapshot.failed_total();

  for (const auto& op : snapshot.operations()) {
    live_[op.id()] = op;
    order_[Key(op)] = op.id();
  }
  for (const auto& tombstone : snapshot.tombstones()) {
    tombstones_[tombstone.id()] = tombstone;
    tombstone_order_.push_back(tombstone.id());
  }
  for (const auto fingerprint : snapshot.retired_completed()) {
    retired_[fingerprint] = OPERATION_STATE_COMPLETED;
  }
  for (const auto fingerprint : snapshot.retired_failed()) {
    retired_[fingerprint] = OPERATION_STATE_FAILED;
  }

  for (const auto& record : journal) {
    JournalEntry entry;
    ParseOrThrow(entry, record.body, "journal entry");

    Change change;
    if (entry.type() == JOURNAL_ENTRY_TYPE_UPSERT) {
      change.upsert = entry.operation();
    } else if (entry.type() == JOURNAL_ENTRY_TYPE_REMOVE) {
      change.remove = entry.tombstone();
    } else {
      throw std::runtime_error("operation log: unknown journal entry type at seq " + std::to_string(record.seq));
    }
    Apply(change);
    next_enqueue_seq_ = std::max(next_enqueue_seq_, entry.next_enqueue_seq());
    last_seq_         = record.seq;
  }

  appends_since_checkpoint_ = static_cast<uint32_t>(journal.size());
  opened_                   = true;

  SYNCORE_LOG_INFO("operation log opened", {observability::IntField("live", static_cast<int64_t>(live_.size())),
                                            observability::IntField("replayed", static_cast<int64_t>(journal.size())),
                                            observability::IntField("last_seq", static_cast<int64_t>(last_seq_))});
}

std::vector<std::string> OperationLog::Recover() {
  std::vector<std::string> reverted;
  {
    std::lock_guard<std::mutex> writer(writer_mutex_);

    std::vector<Change> changes;
    {
      std::shared_lock lock(mutex_);
      for (const auto& [_, id] : order_) {
        Operation op = live_.at(id);
        if (op.state() != OPERATION_STATE_ADMITTED && op.state() != OPERATION_STATE_IN_FLIGHT) {
          continue;
        }
        // the interrupted transmission counts as an attempt
        op.set_state(OPERATION_STATE_QUEUED);
        op.set_attempts(op.attempts() + 1);
        op.set_last_error("recovered after restart");
        reverted.push_back(op.id());
        changes.push_back({op, std::nullopt});
      }
    }
    if (!changes.empty()) {
      Commit(changes);
    }
  }

  if (!reverted.empty()) {
    SYNCORE_LOG_WARN("operations recovered to queued", {observability::IntField("count", static_cast<int64_t>(reverted.size()))});
    PublishQueueChanged();
  }
  return reverted;
}

// ------------------------------------------------------------
// Enqueue
// ------------------------------------------------------------

std::string OperationLog::Enqueue(Operation op) {
  if (op.id().empty()) {
    throw util::ValidationError("enqueue: operation id is required");
  }
  if (!model::IsValid(op.priority())) {
    throw util::ValidationError("enqueue: operation " + op.id() + " has no valid priority");
  }
  if (op.kind().empty()) {
    throw util::ValidationError("enqueue: operation " + op.id() + " has no kind");
  }
  for (const auto& dep : op.depends_on()) {
    if (dep == op.id()) {
      throw util::ValidationError("enqueue: operation " + op.id() + " depends on itself");
    }
    if (dep.empty()) {
      throw util::ValidationError("enqueue: operation " + op.id() + " has an empty dependency id");
    }
  }

  {
    std::lock_guard<std::mutex> writer(writer_mutex_);

    std::optional<Operation> existing;
    size_t                   live_count = 0;
    {
      std::shared_lock lock(mutex_);
      if (TerminalOutcomeLocked(op.id())) {
        SYNCORE_LOG_DEBUG("enqueue ignored for terminal operation", {observability::StringField("id", op.id())});
        return op.id();
      }
      auto it = live_.find(op.id());
      if (it != live_.end()) existing = it->second;
      live_count = live_.size();
    }

    if (existing) {
      if (existing->state() != OPERATION_STATE_QUEUED) {
        return op.id();
      }
      Operation merged = *existing;
      merged.set_payload(op.payload());
      if (model::Outranks(op.priority(), merged.priority())) {
        // a policy deferral taken at the old priority no longer holds
        merged.set_priority(op.priority());
        merged.set_scheduled_for_ms(0);
      }
      if (!op.target_key().empty()) merged.set_target_key(op.target_key());
      if (op.base_version() > merged.base_version()) merged.set_base_version(op.base_version());
      if (op.requires_review()) merged.set_requires_review(true);
      Commit({{merged, std::nullopt}});
    } else {
      if (live_count >= options_.max_operations) {
        throw util::ResourceExhausted("enqueue: operation log is full (" + std::to_string(options_.max_operations) + " live operations)");
      }

      const uint64_t now = NowMs();
      op.set_state(OPERATION_STATE_QUEUED);
      op.set_attempts(0);
      op.clear_last_error();
      if (op.created_at_ms() == 0) op.set_created_at_ms(now);
      if (op.expires_at_ms() == 0 && options_.default_ttl.count() > 0) {
        op.set_expires_at_ms(op.created_at_ms() + static_cast<uint64_t>(options_.default_ttl.count()));
      }
      {
        std::shared_lock lock(mutex_);
        op.set_enqueue_seq(next_enqueue_seq_);
      }
      Commit({{op, std::nullopt}});
    }
  }

  PublishQueueChanged();
  return op.id();
}

// ------------------------------------------------------------
// Dequeue
// ------------------------------------------------------------

std::vector<Operation> OperationLog::DequeueReady(size_t max, util::TimePoint now, const AdmissionCheck& admit) {
  std::vector<Operation>                         admitted;
  std::vector<std::pair<Operation, std::string>> failed;
  std::vector<Operation>                         deferred;

  {
    std::lock_guard<std::mutex> writer(writer_mutex_);
    const uint64_t              now_ms = util::ToUnixMillis(now);

    std::vector<Change> changes;
    {
      std::shared_lock                lock(mutex_);
      std::unordered_set<std::string> failed_now;

      for (const auto& [_, id] : order_) {
        if (admitted.size() >= max) break;

        const Operation& current = live_.at(id);
        if (current.state() != OPERATION_STATE_QUEUED) continue;

        if (current.expires_at_ms() != 0 && now_ms >= current.expires_at_ms()) {
          failed.emplace_back(current, "expired");
          failed_now.insert(id);
          continue;
        }

        bool ready             = true;
        bool dependency_failed = false;
        for (const auto& dep : current.depends_on()) {
          if (failed_now.contains(dep)) {
            dependency_failed = true;
            break;
          }
          const auto outcome = TerminalOutcomeLocked(dep);
          if (!outcome) {
            // still live, or not enqueued yet
            ready = false;
            continue;
          }
          if (*outcome != OPERATION_STATE_COMPLETED) {
            dependency_failed = true;
            break;
          }
        }
        if (dependency_failed) {
          failed.emplace_back(current, "dependency-failed");
          failed_now.insert(id);
          continue;
        }
        if (!ready) continue;
        if (current.priority() != PRIORITY_CRITICAL && current.scheduled_for_ms() > now_ms) continue;

        if (admit) {
          if (auto until = admit(current)) {
            const uint64_t until_ms = util::ToUnixMillis(*until);
            if (until_ms != current.scheduled_for_ms()) {
              Operation op = current;
              op.set_scheduled_for_ms(until_ms);
              changes.push_back({op, std::nullopt});
              deferred.push_back(op);
            }
            continue;
          }
        }

        Operation op = current;
        op.set_state(OPERATION_STATE_ADMITTED);
        op.set_scheduled_for_ms(0);
        changes.push_back({op, std::nullopt});
        admitted.push_back(op);
      }
    }

    for (auto& [op, reason] : failed) {
      op.set_last_error(reason);
      changes.push_back({std::nullopt, MakeTombstone(op, OPERATION_STATE_FAILED, reason)});
    }

    if (!changes.empty()) {
      Commit(changes);
    }
  }

  for (const auto& op : deferred) {
    if (!events_) break;
    Event event;
    event.set_type(EVENT_TYPE_OPERATION_DEFERRED);
    event.set_subject_id(op.id());
    event.set_kind(op.kind());
    event.set_reason("policy deferred until " + std::to_string(op.scheduled_for_ms()));
    events_->Publish(std::move(event));
  }
  for (const auto& [op, reason] : failed) {
    PublishFailed(op, reason);
  }
  if (!admitted.empty() || !failed.empty() || !deferred.empty()) {
    PublishQueueChanged();
  }
  return admitted;
}

// ------------------------------------------------------------
// Transmission bookkeeping
// ------------------------------------------------------------

Operation OperationLog::MarkInFlight(const std::string& id) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  Operation                   op = RequireLive(id);
  if (op.state() != OPERATION_STATE_ADMITTED) {
    throw util::InvalidState("mark in flight: operation " + id + " is " + std::string(model::ToString(op.state())));
  }
  op.set_state(OPERATION_STATE_IN_FLIGHT);
  op.set_attempts(op.attempts() + 1);
  Commit({{op, std::nullopt}});
  return op;
}

Operation OperationLog::RecordRetry(const std::string& id, const std::string& error) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  Operation                   op = RequireLive(id);
  if (op.state() != OPERATION_STATE_IN_FLIGHT) {
    throw util::InvalidState("record retry: operation " + id + " is not in flight");
  }
  op.set_attempts(op.attempts() + 1);
  op.set_last_error(error);
  Commit({{op, std::nullopt}});
  return op;
}

void OperationLog::Ack(const std::string& id, AckOutcome outcome, const std::string& reason, const TxHook& hook) {
  Operation op;
  {
    std::lock_guard<std::mutex> writer(writer_mutex_);
    {
      std::shared_lock lock(mutex_);
      if (!live_.contains(id) && TerminalOutcomeLocked(id)) {
        // duplicate ack after a terminal transition
        return;
      }
    }
    op = RequireLive(id);

    switch (outcome) {
      case AckOutcome::kCompleted: {
        if (!model::CanTransition(op.state(), OPERATION_STATE_COMPLETED)) {
          throw util::InvalidState("ack: operation " + id + " cannot complete from " + std::string(model::ToString(op.state())));
        }
        op.set_state(OPERATION_STATE_COMPLETED);
        Commit({{std::nullopt, MakeTombstone(op, OPERATION_STATE_COMPLETED, reason)}}, hook);
        observability::Metrics::Instance().RecordOperationOutcome("completed");
        break;
      }
      case AckOutcome::kConflicted: {
        if (!model::CanTransition(op.state(), OPERATION_STATE_CONFLICTED)) {
          throw util::InvalidState("ack: operation " + id + " cannot be parked from " + std::string(model::ToString(op.state())));
        }
        op.set_state(OPERATION_STATE_CONFLICTED);
        op.set_last_error(reason);
        Commit({{op, std::nullopt}}, hook);
        observability::Metrics::Instance().RecordOperationOutcome("conflicted");
        break;
      }
      case AckOutcome::kFailed: {
        op.set_state(OPERATION_STATE_FAILED);
        op.set_last_error(reason);
        Commit({{std::nullopt, MakeTombstone(op, OPERATION_STATE_FAILED, reason)}}, hook);
        observability::Metrics::Instance().RecordOperationOutcome("failed");
        break;
      }
    }
  }

  if (outcome == AckOutcome::kFailed) {
    PublishFailed(op, reason);
  }
  PublishQueueChanged();
}

void OperationLog::Requeue(const std::string& id, const std::string& reason, const Amender& amend, const TxHook& hook) {
  {
    std::lock_guard<std::mutex> writer(writer_mutex_);
    Operation                   op = RequireLive(id);
    if (!model::CanTransition(op.state(), OPERATION_STATE_QUEUED)) {
      throw util::InvalidState("requeue: operation " + id + " is " + std::string(model::ToString(op.state())));
    }
    if (amend) amend(op);
    op.set_id(id);
    op.set_state(OPERATION_STATE_QUEUED);
    op.set_last_error(reason);
    op.set_scheduled_for_ms(0);
    Commit({{op, std::nullopt}}, hook);
  }
  PublishQueueChanged();
}

void OperationLog::Amend(const std::string& id, const Amender& amend, const TxHook& hook) {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  Operation                   op = RequireLive(id);
  const auto                  state    = op.state();
  const auto                  priority = op.priority();
  const auto                  seq      = op.enqueue_seq();
  amend(op);
  op.set_id(id);
  op.set_state(state);
  op.set_priority(priority);
  op.set_enqueue_seq(seq);
  Commit({{op, std::nullopt}}, hook);
}

bool OperationLog::Cancel(const std::string& id) {
  {
    std::lock_guard<std::mutex> writer(writer_mutex_);
    std::optional<Operation>    op;
    {
      std::shared_lock lock(mutex_);
      auto             it = live_.find(id);
      if (it == live_.end() || it->second.state() != OPERATION_STATE_QUEUED) {
        return false;
      }
      op = it->second;
    }
    op->set_state(OPERATION_STATE_FAILED);
    op->set_last_error("cancelled");
    Commit({{std::nullopt, MakeTombstone(*op, OPERATION_STATE_FAILED, "cancelled")}});
  }
  SYNCORE_LOG_INFO("operation cancelled", {observability::StringField("id", id)});
  PublishQueueChanged();
  return true;
}

// ------------------------------------------------------------
// Readers
// ------------------------------------------------------------

std::optional<Operation> OperationLog::Get(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = live_.find(id);
  if (it == live_.end()) return std::nullopt;
  return it->second;
}

std::optional<Tombstone> OperationLog::GetTombstone(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = tombstones_.find(id);
  if (it == tombstones_.end()) return std::nullopt;
  return it->second;
}

std::vector<Operation> OperationLog::ListOperations() const {
  std::shared_lock       lock(mutex_);
  std::vector<Operation> out;
  out.reserve(order_.size());
  for (const auto& [_, id] : order_) {
    out.push_back(live_.at(id));
  }
  return out;
}

QueueSnapshot OperationLog::PeekStatus(util::TimePoint now) const {
  std::shared_lock lock(mutex_);
  QueueSnapshot    snapshot;

  const uint64_t                 now_ms = util::ToUnixMillis(now);
  std::map<int, uint64_t>        by_state;
  std::map<int, uint64_t>        by_priority;
  uint64_t                       attempts      = 0;
  uint64_t                       oldest_queued = std::numeric_limits<uint64_t>::max();
  uint64_t                       next_schedule = 0;

  for (const auto& [_, op] : live_) {
    by_state[op.state()]++;
    by_priority[op.priority()]++;
    attempts += op.attempts();
    if (op.state() == OPERATION_STATE_QUEUED) {
      oldest_queued = std::min(oldest_queued, op.created_at_ms());
      if (op.scheduled_for_ms() > now_ms && (next_schedule == 0 || op.scheduled_for_ms() < next_schedule)) {
        next_schedule = op.scheduled_for_ms();
      }
    }
  }

  snapshot.set_live(live_.size());
  for (const auto& [state, count] : by_state) {
    auto* entry = snapshot.add_by_state();
    entry->set_state(static_cast<OperationState>(state));
    entry->set_count(count);
  }
  for (const auto& [priority, count] : by_priority) {
    auto* entry = snapshot.add_by_priority();
    entry->set_priority(static_cast<Priority>(priority));
    entry->set_count(count);
  }
  snapshot.set_completed_total(completed_total_);
  snapshot.set_failed_total(failed_total_);
  snapshot.set_average_attempts(live_.empty() ? 0.0 : static_cast<double>(attempts) / static_cast<double>(live_.size()));
  if (oldest_queued != std::numeric_limits<uint64_t>::max() && now_ms > oldest_queued) {
    snapshot.set_oldest_queued_age_ms(now_ms - oldest_queued);
  }
  snapshot.set_next_scheduled_ms(next_schedule);
  return snapshot;
}

// ------------------------------------------------------------
// Checkpoint
// ------------------------------------------------------------

void OperationLog::Checkpoint() {
  std::lock_guard<std::mutex> writer(writer_mutex_);
  CheckpointLocked();
}

void OperationLog::CheckpointLocked() {
  OperationCheckpoint snapshot;
  {
    std::shared_lock lock(mutex_);
    snapshot.set_last_seq(last_seq_);
    snapshot.set_next_enqueue_seq(next_enqueue_seq_);
    snapshot.set_completed_total(completed_total_);
    snapshot.set_failed_total(failed_total_);
    for (const auto& [_, id] : order_) {
      *snapshot.add_operations() = live_.at(id);
    }
    for (const auto& id : tombstone_order_) {
      *snapshot.add_tombstones() = tombstones_.at(id);
    }
    for (const auto& [fingerprint, outcome] : retired_) {
      if (outcome == OPERATION_STATE_COMPLETED) {
        snapshot.add_retired_completed(fingerprint);
      } else {
        snapshot.add_retired_failed(fingerprint);
      }
    }
  }
  snapshot.set_taken_at_ms(NowMs());

  db::model::CheckpointRecord record;
  record.last_seq    = snapshot.last_seq();
  record.taken_at_ms = snapshot.taken_at_ms();
  if (!snapshot.SerializeToString(&record.body)) {
    throw std::runtime_error("checkpoint: serialize failed");
  }

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->PutCheckpoint(*tx, record), "write checkpoint");
  db::ThrowIfDbError(repository_->TruncateJournal(*tx, record.last_seq), "truncate journal");
  tx->Commit();

  appends_since_checkpoint_ = 0;
  SYNCORE_LOG_DEBUG("operation log checkpoint", {observability::IntField("last_seq", static_cast<int64_t>(record.last_seq)),
                                                 observability::IntField("live", snapshot.operations_size())});
}

// ------------------------------------------------------------
// Internals
// ------------------------------------------------------------

void OperationLog::Commit(const std::vector<Change>& changes, const TxHook& hook) {
  if (!opened_) {
    throw util::InvalidState("operation log is not open");
  }

  uint64_t next_enqueue_seq;
  {
    std::shared_lock lock(mutex_);
    next_enqueue_seq = next_enqueue_seq_;
  }
  for (const auto& change : changes) {
    if (change.upsert && change.upsert->enqueue_seq() >= next_enqueue_seq) {
      next_enqueue_seq = change.upsert->enqueue_seq() + 1;
    }
  }

  const uint64_t now  = NowMs();
  uint64_t       last = 0;
  auto           tx   = repository_->Begin();
  for (const auto& change : changes) {
    JournalEntry entry;
    entry.set_next_enqueue_seq(next_enqueue_seq);

    db::model::JournalRecord record;
    record.appended_at_ms = now;
    if (change.upsert) {
      entry.set_type(JOURNAL_ENTRY_TYPE_UPSERT);
      *entry.mutable_operation() = *change.upsert;
      record.op_id               = change.upsert->id();
    } else {
      entry.set_type(JOURNAL_ENTRY_TYPE_REMOVE);
      *entry.mutable_tombstone() = *change.remove;
      record.op_id               = change.remove->id();
    }
    record.entry_type = entry.type();
    if (!entry.SerializeToString(&record.body)) {
      throw std::runtime_error("journal: serialize failed for " + record.op_id);
    }
    db::ThrowIfDbError(repository_->AppendJournal(*tx, record), "append journal");
    last = record.seq;
  }
  if (hook) {
    hook(*tx);
  }
  tx->Commit();

  {
    std::unique_lock lock(mutex_);
    for (const auto& change : changes) {
      Apply(change);
    }
    next_enqueue_seq_ = std::max(next_enqueue_seq_, next_enqueue_seq);
    last_seq_         = std::max(last_seq_, last);
  }

  appends_since_checkpoint_ += static_cast<uint32_t>(changes.size());
  if (options_.checkpoint_every > 0 && appends_since_checkpoint_ >= options_.checkpoint_every) {
    CheckpointLocked();
  }
}

// caller holds the unique lock
void OperationLog::Apply(const Change& change) {
  if (change.upsert) {
    const auto& op = *change.upsert;
    auto        it = live_.find(op.id());
    if (it != live_.end()) {
      order_.erase(Key(it->second));
    }
    live_[op.id()]  = op;
    order_[Key(op)] = op.id();
    return;
  }

  const auto& tombstone = *change.remove;
  auto        it        = live_.find(tombstone.id());
  if (it != live_.end()) {
    order_.erase(Key(it->second));
    live_.erase(it);
  }
  if (!tombstones_.contains(tombstone.id())) {
    tombstone_order_.push_back(tombstone.id());
  }
  tombstones_[tombstone.id()] = tombstone;
  if (tombstone.outcome() == OPERATION_STATE_COMPLETED) {
    completed_total_++;
  } else {
    failed_total_++;
  }
  PruneTombstonesLocked();
}

// Oldest tombstones beyond the retention go first, except those a live
// operation still depends on. Pruned ids keep their outcome as a fingerprint.
void OperationLog::PruneTombstonesLocked() {
  if (options_.completed_retention == 0 || tombstone_order_.size() <= options_.completed_retention) {
    return;
  }

  std::unordered_set<std::string> referenced;
  for (const auto& [_, op] : live_) {
    referenced.insert(op.depends_on().begin(), op.depends_on().end());
  }

  auto it = tombstone_order_.begin();
  while (tombstone_order_.size() > options_.completed_retention && it != tombstone_order_.end()) {
    if (referenced.contains(*it)) {
      ++it;
      continue;
    }
    retired_[Fingerprint(*it)] = tombstones_.at(*it).outcome();
    tombstones_.erase(*it);
    it = tombstone_order_.erase(it);
  }
}

// caller holds the shared or unique lock
std::optional<OperationState> OperationLog::TerminalOutcomeLocked(const std::string& id) const {
  if (auto it = tombstones_.find(id); it != tombstones_.end()) {
    return it->second.outcome();
  }
  if (auto it = retired_.find(Fingerprint(id)); it != retired_.end()) {
    return it->second;
  }
  return std::nullopt;
}

Operation OperationLog::RequireLive(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto             it = live_.find(id);
  if (it == live_.end()) {
    throw util::NotFound("operation not found: " + id);
  }
  return it->second;
}

Tombstone OperationLog::MakeTombstone(const Operation& op, OperationState outcome, const std::string& reason) const {
  Tombstone tombstone;
  tombstone.set_id(op.id());
  tombstone.set_outcome(outcome);
  tombstone.set_removed_at_ms(NowMs());
  tombstone.set_reason(reason);
  return tombstone;
}

void OperationLog::PublishQueueChanged() {
  auto snapshot = PeekStatus();

  std::map<int, uint64_t> depth;
  for (const auto& entry : snapshot.by_priority()) {
    depth[entry.priority()] = entry.count();
  }
  for (int p = PRIORITY_CRITICAL; p <= PRIORITY_BACKGROUND; ++p) {
    observability::Metrics::Instance().SetQueueDepth(model::ToString(static_cast<Priority>(p)), depth[p]);
  }
  if (!events_) return;

  Event event;
  event.set_type(EVENT_TYPE_QUEUE_CHANGED);
  *event.mutable_queue() = std::move(snapshot);
  events_->Publish(std::move(event));
}

void OperationLog::PublishFailed(const Operation& op, const std::string& reason) {
  SYNCORE_LOG_WARN("operation failed", {observability::StringField("id", op.id()), observability::StringField("kind", op.kind()),
                                        observability::StringField("reason", reason),
                                        observability::IntField("attempts", op.attempts())});
  if (!events_) return;

  Event event;
  event.set_type(EVENT_TYPE_OPERATION_FAILED);
  event.set_subject_id(op.id());
  event.set_kind(op.kind());
  event.set_reason(reason);
  events_->Publish(std::move(event));
}

} // namespace syncore::oplog
