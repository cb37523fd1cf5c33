#include "internal/sync/sync_coordinator.hpp"

#include <chrono>
#include <vector>

#include "internal/cache/cache_store.hpp"
#include "internal/cache/cipher.hpp"
#include "internal/conflict/conflict_ledger.hpp"
#include "internal/conflict/conflict_resolver.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/oplog/operation_log.hpp"
#include "internal/policy/policy_gate.hpp"
#include "internal/remote/remote_endpoint.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace syncore::sync {

using namespace syncore::v1;

namespace {

uint64_t NowMs() {
  return util::ToUnixMillis(util::Now());
}

std::string_view StatusName(SessionStatus status) {
  switch (status) {
    case SESSION_STATUS_COMPLETED:
      return "completed";
    case SESSION_STATUS_PARTIAL_FAILURE:
      return "partial_failure";
    case SESSION_STATUS_SKIPPED:
      return "skipped";
    case SESSION_STATUS_ABORTED:
      return "aborted";
    case SESSION_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

Change ChangeFromOperation(const Operation& op, uint64_t version) {
  Change change;
  change.set_key(op.target_key());
  change.set_value(op.payload());
  change.set_version(version);
  change.set_kind(op.kind());
  change.set_origin_role(op.origin_role());
  return change;
}

// Hands the half-open trial push back when a push ends without a transport
// verdict (cancelled, fatal, local failure).
class TrialSlot {
 public:
  TrialSlot(CircuitBreaker& breaker, bool held) : breaker_(breaker), held_(held) {
  }
  ~TrialSlot() {
    if (held_) breaker_.ReleaseTrial();
  }

  TrialSlot(const TrialSlot&)            = delete;
  TrialSlot& operator=(const TrialSlot&) = delete;

  void Settle() {
    held_ = false;
  }

 private:
  CircuitBreaker& breaker_;
  bool            held_;
};

} // namespace

SyncCoordinatorOptions SyncCoordinatorOptions::FromConfig(const syncore::runtime::config::SyncConfig& config) {
  SyncCoordinatorOptions options;
  if (config.max_batch() != 0) options.max_batch = config.max_batch();
  if (config.max_concurrency() != 0) options.max_concurrency = config.max_concurrency();
  if (config.schema_version() != 0) options.schema_version = config.schema_version();
  if (config.pull_page_size() != 0) options.pull_page_size = config.pull_page_size();
  options.retry           = config.retry();
  options.circuit_breaker = config.circuit_breaker();
  return options;
}

SyncCoordinator::SyncCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<oplog::OperationLog> oplog,
                                 std::shared_ptr<cache::CacheStore> cache, std::shared_ptr<policy::PolicyGate> gate,
                                 std::shared_ptr<conflict::ConflictResolver> resolver, std::shared_ptr<conflict::ConflictLedger> ledger,
                                 std::shared_ptr<remote::RemoteEndpoint> remote, SyncCoordinatorOptions options,
                                 std::shared_ptr<events::EventBus> events)
    : repository_(std::move(repository)),
      oplog_(std::move(oplog)),
      cache_(std::move(cache)),
      gate_(std::move(gate)),
      resolver_(std::move(resolver)),
      ledger_(std::move(ledger)),
      remote_(std::move(remote)),
      options_(std::move(options)),
      events_(std::move(events)),
      retry_(options_.retry),
      breaker_(options_.circuit_breaker),
      channel_(std::make_shared<TaskChannel<PushTask>>()) {
  if (!repository_ || !oplog_ || !cache_ || !gate_ || !resolver_ || !ledger_ || !remote_) {
    throw std::invalid_argument("sync coordinator: missing dependency");
  }
  workers_ = std::make_unique<PushWorkerPool>(channel_, *this, options_.max_concurrency);
  workers_->Start();
}

SyncCoordinator::~SyncCoordinator() {
  CancelSession();
  workers_->Stop();
}

void SyncCoordinator::SetContextProvider(ContextProvider provider) {
  std::lock_guard lock(context_mutex_);
  context_provider_ = std::move(provider);
}

bool SyncCoordinator::CancelSession() {
  std::lock_guard lock(source_mutex_);
  if (!source_) return false;
  source_->Cancel();
  return true;
}

bool SyncCoordinator::QueuePaused() const {
  auto tx     = repository_->Begin();
  auto paused = repository_->GetSyncState(*tx, kQueuePausedKey);
  tx->Commit();
  return paused.value_or("") == "1";
}

void SyncCoordinator::SetQueuePaused(bool paused) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->PutSyncState(*tx, kQueuePausedKey, paused ? "1" : "0"), "set queue paused");
  tx->Commit();
  SYNCORE_LOG_INFO(paused ? "push queue paused" : "push queue resumed");
}

std::string SyncCoordinator::Cursor() const {
  auto tx     = repository_->Begin();
  auto cursor = repository_->GetSyncState(*tx, kCursorKey);
  tx->Commit();
  return cursor.value_or("");
}

BreakerState SyncCoordinator::Breaker() const {
  return breaker_.State();
}

// ------------------------------------------------------------
// Session
// ------------------------------------------------------------

SyncOutcome SyncCoordinator::RunSession(std::optional<uint32_t> max_batch) {
  SyncOutcome outcome;
  outcome.set_session_id(util::NewId());
  outcome.set_started_at_ms(NowMs());

  std::unique_lock session(session_mutex_, std::try_to_lock);
  if (!session.owns_lock()) {
    outcome.set_status(SESSION_STATUS_SKIPPED);
    outcome.set_error("another session is running");
    outcome.set_finished_at_ms(NowMs());
    return outcome;
  }

  auto source = std::make_shared<util::CancellationSource>();
  {
    std::lock_guard lock(source_mutex_);
    source_ = source;
  }
  const auto token = source->Token();

  observability::SpanScope span("sync.session");
  span.SetAttribute("session.id", outcome.session_id());
  const auto start = std::chrono::steady_clock::now();
  PublishSession(EVENT_TYPE_SYNC_STARTED, outcome);

  policy::PolicyContext context;
  {
    std::lock_guard lock(context_mutex_);
    if (context_provider_) context = context_provider_();
  }

  const uint32_t batch = max_batch.value_or(options_.max_batch);
  outcome.set_batch_size(batch);

  auto          counters = std::make_shared<SessionCounters>();
  SessionStatus status   = SESSION_STATUS_COMPLETED;
  std::string   error;
  uint32_t      pulled   = 0;

  if (!context.Online()) {
    status = SESSION_STATUS_SKIPPED;
    error  = "offline";
  } else {
    try {
      std::unordered_map<std::string, Change> touched;
      try {
        PullDelta(token, touched, pulled);
      } catch (const util::TransientTransportError& e) {
        // pushes may still go through
        status = SESSION_STATUS_PARTIAL_FAILURE;
        error  = e.what();
        SYNCORE_LOG_WARN("pull failed", {observability::StringField("error", e.what())});
      }
      Reconcile(touched, *counters);
      PushOperations(batch, context, token, counters);
    } catch (const util::FatalError& e) {
      status = SESSION_STATUS_ABORTED;
      error  = e.what();
    } catch (const util::Cancelled& e) {
      status = SESSION_STATUS_CANCELLED;
      error  = e.what();
    } catch (const std::exception& e) {
      status = SESSION_STATUS_ABORTED;
      error  = e.what();
      span.RecordException(e.what());
    }
  }

  {
    std::lock_guard lock(counters->error_mutex);
    if (!counters->fatal_error.empty()) {
      status = SESSION_STATUS_ABORTED;
      error  = counters->fatal_error;
    }
  }
  if (status != SESSION_STATUS_ABORTED && token.IsCancelled()) {
    status = SESSION_STATUS_CANCELLED;
  }
  if (status == SESSION_STATUS_COMPLETED && counters->failed > 0) {
    status = SESSION_STATUS_PARTIAL_FAILURE;
  }

  {
    std::lock_guard lock(source_mutex_);
    source_.reset();
  }

  outcome.set_status(status);
  outcome.set_error(error);
  outcome.set_pulled(pulled);
  outcome.set_pushed(counters->pushed);
  outcome.set_conflicted(counters->conflicted);
  outcome.set_deferred(counters->deferred);
  outcome.set_failed(counters->failed);
  outcome.set_retried(counters->retried);
  outcome.set_requeued(counters->requeued);
  outcome.set_breaker_state(breaker_.State());
  outcome.set_cursor(Cursor());
  outcome.set_finished_at_ms(NowMs());

  span.SetAttribute("session.status", StatusName(status));
  span.SetAttribute("session.pulled", static_cast<int64_t>(outcome.pulled()));
  span.SetAttribute("session.pushed", static_cast<int64_t>(outcome.pushed()));
  span.SetAttribute("session.conflicted", static_cast<int64_t>(outcome.conflicted()));

  const double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  observability::Metrics::Instance().ObserveSyncDurationMs(StatusName(status), elapsed_ms);

  if (status == SESSION_STATUS_ABORTED) {
    span.RecordException(error);
    SYNCORE_LOG_ERROR("sync session aborted", {observability::StringField("session_id", outcome.session_id()),
                                               observability::StringField("error", error)});
  } else {
    SYNCORE_LOG_INFO("sync session finished", {observability::StringField("session_id", outcome.session_id()),
                                               observability::StringField("status", StatusName(status)),
                                               observability::IntField("pulled", outcome.pulled()),
                                               observability::IntField("pushed", outcome.pushed()),
                                               observability::IntField("conflicted", outcome.conflicted()),
                                               observability::IntField("failed", outcome.failed())});
  }

  PublishSession(EVENT_TYPE_SYNC_COMPLETED, outcome);
  return outcome;
}

void SyncCoordinator::PullDelta(const util::CancellationToken& token, std::unordered_map<std::string, Change>& touched,
                                uint32_t& pulled) {
  std::string cursor = Cursor();

  while (true) {
    if (token.IsCancelled()) {
      throw util::Cancelled("session cancelled during pull");
    }

    PullRequest request;
    request.set_cursor(cursor);
    request.set_schema_version(options_.schema_version);
    request.set_max_changes(options_.pull_page_size);

    auto response = remote_->Pull(request, token);
    if (response.schema_version() != options_.schema_version) {
      throw util::FatalError("remote schema version " + std::to_string(response.schema_version()) + " does not match " +
                             std::to_string(options_.schema_version));
    }

    const std::vector<Change> changes(response.changes().begin(), response.changes().end());
    const std::string         next = response.new_cursor();

    cache_->MergeRemote(changes, [&](db::Transaction& tx) {
      db::ThrowIfDbError(repository_->PutSyncState(tx, kCursorKey, next), "advance cursor");
    });

    cursor = next;
    for (const auto& change : changes) {
      touched[change.key()] = change;
    }
    pulled += static_cast<uint32_t>(changes.size());

    if (!response.has_more() || changes.empty()) break;
  }
}

void SyncCoordinator::Reconcile(const std::unordered_map<std::string, Change>& touched, SessionCounters& counters) {
  if (touched.empty()) return;

  for (const auto& op : oplog_->ListOperations()) {
    if (op.state() != OPERATION_STATE_QUEUED || op.target_key().empty()) continue;

    auto it = touched.find(op.target_key());
    if (it == touched.end() || it->second.version() <= op.base_version()) continue;

    auto conflict   = BuildConflict(op, it->second);
    auto resolution = resolver_->Resolve(conflict);
    counters.conflicted++;
    ApplyResolution(op, it->second, std::move(conflict), resolution, false);
  }
}

void SyncCoordinator::PushOperations(uint32_t max_batch, const policy::PolicyContext& context, const util::CancellationToken& token,
                                     const std::shared_ptr<SessionCounters>& counters) {
  if (breaker_.State() == BREAKER_STATE_OPEN) {
    SYNCORE_LOG_INFO("pushes suspended by open circuit breaker");
    return;
  }
  if (QueuePaused()) {
    SYNCORE_LOG_INFO("pushes suspended: queue paused");
    return;
  }

  uint32_t deferred = 0;
  auto     admit    = [&](const Operation& op) -> std::optional<util::TimePoint> {
    auto decision = gate_->Decide(op, context);
    if (decision.admit) return std::nullopt;
    deferred++;
    return decision.not_before;
  };
  auto batch         = oplog_->DequeueReady(max_batch, context.now, admit);
  counters->deferred = deferred;

  size_t i = 0;
  while (i < batch.size()) {
    std::string stop;
    if (token.IsCancelled()) {
      stop = "session cancelled";
    } else {
      std::lock_guard lock(counters->error_mutex);
      stop = counters->fatal_error;
    }
    if (stop.empty() && breaker_.State() == BREAKER_STATE_OPEN) {
      stop = "circuit breaker open";
    }
    if (!stop.empty()) {
      for (; i < batch.size(); ++i) Requeue(batch[i], stop, *counters);
      break;
    }

    const auto tier = batch[i].priority();
    size_t     end  = i;
    while (end < batch.size() && batch[end].priority() == tier) end++;

    auto group = std::make_shared<TaskGroup>();
    group->Add(end - i);
    for (size_t k = i; k < end; ++k) {
      channel_->Send(PushTask{batch[k], token, counters, group});
    }
    group->Wait();
    i = end;
  }
}

// ------------------------------------------------------------
// Push (worker threads)
// ------------------------------------------------------------

void SyncCoordinator::ExecutePush(const PushTask& task) {
  try {
    Transmit(task);
  } catch (const std::exception& e) {
    SYNCORE_LOG_ERROR("push failed locally", {observability::StringField("operation_id", task.operation.id()),
                                              observability::StringField("error", e.what())});
    try {
      const auto current = oplog_->Get(task.operation.id());
      if (current && (current->state() == OPERATION_STATE_ADMITTED || current->state() == OPERATION_STATE_IN_FLIGHT)) {
        Requeue(*current, std::string("local failure: ") + e.what(), *task.counters);
      }
    } catch (const std::exception& requeue_error) {
      SYNCORE_LOG_ERROR("push: requeue after local failure failed",
                        {observability::StringField("operation_id", task.operation.id()),
                         observability::StringField("error", requeue_error.what())});
    }
  }
}

void SyncCoordinator::Transmit(const PushTask& task) {
  auto&     counters = *task.counters;
  Operation op       = task.operation;

  if (task.token.IsCancelled()) {
    Requeue(op, "session cancelled", counters);
    return;
  }
  const auto admission = breaker_.Admit();
  if (admission == CircuitBreaker::Admission::kRejected) {
    Requeue(op, "circuit breaker open", counters);
    return;
  }
  TrialSlot trial(breaker_, admission == CircuitBreaker::Admission::kTrial);

  op                 = oplog_->MarkInFlight(op.id());
  uint32_t conflicts = 0;

  while (true) {
    PushRequest request;
    *request.mutable_operation() = op;
    request.set_schema_version(options_.schema_version);

    PushResponse response;
    try {
      response = remote_->Push(request, task.token);
    } catch (const util::TransientTransportError& e) {
      breaker_.RecordFailure();
      trial.Settle();
      const auto current  = oplog_->Get(op.id());
      const auto attempts = current ? current->attempts() : op.attempts();
      if (!retry_.CanRetry(attempts)) {
        oplog_->Ack(op.id(), oplog::AckOutcome::kFailed, std::string("retries exhausted: ") + e.what());
        counters.failed++;
        return;
      }
      if (breaker_.State() == BREAKER_STATE_OPEN) {
        Requeue(op, e.what(), counters);
        return;
      }
      if (task.token.WaitFor(retry_.NextDelay(attempts))) {
        Requeue(op, "session cancelled", counters);
        return;
      }
      op = oplog_->RecordRetry(op.id(), e.what());
      counters.retried++;
      continue;
    } catch (const util::Cancelled&) {
      Requeue(op, "session cancelled", counters);
      return;
    } catch (const util::FatalError& e) {
      Requeue(op, e.what(), counters);
      std::lock_guard lock(counters.error_mutex);
      counters.fatal_error = e.what();
      return;
    } catch (const std::exception& e) {
      // rejected by the remote; not retryable
      breaker_.RecordSuccess();
      trial.Settle();
      oplog_->Ack(op.id(), oplog::AckOutcome::kFailed, std::string("rejected: ") + e.what());
      counters.failed++;
      return;
    }

    breaker_.RecordSuccess();
    trial.Settle();
    if (response.schema_version() != 0 && response.schema_version() != options_.schema_version) {
      Requeue(op, "schema mismatch", counters);
      std::lock_guard lock(counters.error_mutex);
      counters.fatal_error = "remote schema version " + std::to_string(response.schema_version()) + " does not match";
      return;
    }

    if (response.has_ack()) {
      Complete(op, response.ack().version());
      counters.pushed++;
      return;
    }
    if (!response.has_conflict()) {
      oplog_->Ack(op.id(), oplog::AckOutcome::kFailed, "empty push response");
      counters.failed++;
      return;
    }

    conflicts++;
    counters.conflicted++;
    const auto& remote     = response.conflict().remote();
    auto        conflict   = BuildConflict(op, remote);
    auto        resolution = resolver_->Resolve(conflict);
    if (conflicts > 1 && resolution.kind() != RESOLUTION_KIND_MANUAL_REQUIRED) {
      resolution.set_kind(RESOLUTION_KIND_MANUAL_REQUIRED);
      resolution.clear_value();
      resolution.set_reason("conflicted again after rebase (" + resolution.reason() + ")");
    }

    auto rebased = ApplyResolution(op, remote, std::move(conflict), resolution, true);
    if (!rebased) return;
    op = oplog_->RecordRetry(op.id(), "rebased after conflict");
  }
}

void SyncCoordinator::Complete(const Operation& op, uint64_t version) {
  std::optional<cache::PreparedWrite> write;
  if (!op.target_key().empty()) {
    write = cache_->PrepareRemote(ChangeFromOperation(op, version));
  }
  oplog_->Ack(op.id(), oplog::AckOutcome::kCompleted, "acknowledged", [&](db::Transaction& tx) {
    if (write) cache_->Persist(tx, *write);
  });
  if (write) cache_->Publish(*write);
}

void SyncCoordinator::Requeue(const Operation& op, const std::string& reason, SessionCounters& counters) {
  oplog_->Requeue(op.id(), reason);
  counters.requeued++;
}

// ------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------

Conflict SyncCoordinator::BuildConflict(const Operation& op, const Change& remote) const {
  Conflict conflict;
  conflict.set_id(util::NewId());
  conflict.set_operation_id(op.id());
  conflict.set_key(op.target_key());
  conflict.set_kind(op.kind());
  conflict.set_detected_at_ms(NowMs());

  auto* local = conflict.mutable_local();
  local->set_value(op.payload());
  local->set_version(op.base_version());
  local->set_timestamp_ms(op.created_at_ms());
  local->set_role(op.origin_role());
  local->set_checksum(cache::Sha256Hex(op.payload()));
  local->set_requires_review(op.requires_review());

  auto* theirs = conflict.mutable_remote();
  theirs->set_value(remote.value());
  theirs->set_version(remote.version());
  theirs->set_timestamp_ms(remote.timestamp_ms());
  theirs->set_role(remote.origin_role());
  theirs->set_checksum(remote.checksum());
  theirs->set_requires_review(remote.requires_review());
  return conflict;
}

std::optional<Operation> SyncCoordinator::ApplyResolution(const Operation& op, const Change& remote, Conflict conflict,
                                                          const Resolution& resolution, bool in_flight) {
  conflict.set_rule(resolution.rule());
  conflict.set_resolution(resolution.kind());
  conflict.set_resolved_value(resolution.value());
  conflict.set_audit_timestamp_ms(NowMs());

  observability::Metrics::Instance().RecordConflict(syncore::conflict::RuleName(resolution.rule()));
  ledger_->PublishDetected(conflict);

  switch (resolution.kind()) {
    case RESOLUTION_KIND_KEEP_LOCAL:
    case RESOLUTION_KIND_MERGED: {
      oplog_->Amend(
          op.id(),
          [&](Operation& amended) {
            amended.set_base_version(remote.version());
            if (resolution.kind() == RESOLUTION_KIND_MERGED) amended.set_payload(resolution.value());
          },
          [&](db::Transaction& tx) { ledger_->Audit(tx, conflict, resolution, false); });
      ledger_->PublishResolved(conflict, resolution);
      return oplog_->Get(op.id());
    }

    case RESOLUTION_KIND_KEEP_REMOTE: {
      if (in_flight) {
        auto write = cache_->PrepareRemote(remote);
        oplog_->Ack(op.id(), oplog::AckOutcome::kCompleted, "superseded by remote", [&](db::Transaction& tx) {
          cache_->Persist(tx, write);
          ledger_->Audit(tx, conflict, resolution, false);
        });
        cache_->Publish(write);
      } else {
        // the pulled value is already cached; park first so a crash leaves
        // the conflict open rather than losing the decision
        oplog_->Ack(op.id(), oplog::AckOutcome::kConflicted, resolution.reason(),
                    [&](db::Transaction& tx) { ledger_->Park(tx, conflict); });
        oplog_->Ack(op.id(), oplog::AckOutcome::kCompleted, "superseded by remote", [&](db::Transaction& tx) {
          ledger_->Close(tx, conflict.id());
          ledger_->Audit(tx, conflict, resolution, false);
        });
      }
      ledger_->PublishResolved(conflict, resolution);
      return std::nullopt;
    }

    default: {
      oplog_->Ack(op.id(), oplog::AckOutcome::kConflicted, resolution.reason(), [&](db::Transaction& tx) {
        ledger_->Park(tx, conflict);
        ledger_->Audit(tx, conflict, resolution, false);
      });
      SYNCORE_LOG_WARN("operation parked for manual resolution", {observability::StringField("operation_id", op.id()),
                                                                   observability::StringField("conflict_id", conflict.id()),
                                                                   observability::RedactedField("payload", op.payload()),
                                                                   observability::StringField("reason", resolution.reason())});
      return std::nullopt;
    }
  }
}

Resolution SyncCoordinator::ResolveConflict(const std::string& conflict_id, ResolutionKind kind, const std::string& merged_value) {
  if (kind != RESOLUTION_KIND_KEEP_LOCAL && kind != RESOLUTION_KIND_KEEP_REMOTE && kind != RESOLUTION_KIND_MERGED) {
    throw util::ValidationError("resolve: resolution must be keep_local, keep_remote or merged");
  }

  auto open = ledger_->GetOpen(conflict_id);
  if (!open) {
    throw util::NotFound("conflict not found: " + conflict_id);
  }
  Conflict conflict = *open;

  Resolution resolution;
  resolution.set_conflict_id(conflict_id);
  resolution.set_rule(CONFLICT_RULE_MANUAL);
  resolution.set_kind(kind);
  resolution.set_reason("resolved manually");
  switch (kind) {
    case RESOLUTION_KIND_KEEP_LOCAL:
      resolution.set_value(conflict.local().value());
      break;
    case RESOLUTION_KIND_KEEP_REMOTE:
      resolution.set_value(conflict.remote().value());
      break;
    default:
      resolution.set_value(merged_value);
      break;
  }

  conflict.set_rule(CONFLICT_RULE_MANUAL);
  conflict.set_resolution(kind);
  conflict.set_resolved_value(resolution.value());
  conflict.set_audit_timestamp_ms(NowMs());

  std::optional<cache::PreparedWrite> write;
  if (kind == RESOLUTION_KIND_KEEP_REMOTE && !conflict.key().empty()) {
    Change change;
    change.set_key(conflict.key());
    change.set_value(conflict.remote().value());
    change.set_version(conflict.remote().version());
    change.set_kind(conflict.kind());
    change.set_origin_role(conflict.remote().role());
    write = cache_->PrepareRemote(change);
  }

  auto hook = [&](db::Transaction& tx) {
    ledger_->Close(tx, conflict_id);
    ledger_->Audit(tx, conflict, resolution, true);
    if (write) cache_->Persist(tx, *write);
  };

  const auto op = oplog_->Get(conflict.operation_id());
  if (!op) {
    auto tx = repository_->Begin();
    hook(*tx);
    tx->Commit();
  } else if (kind == RESOLUTION_KIND_KEEP_REMOTE) {
    oplog_->Ack(op->id(), oplog::AckOutcome::kCompleted, "resolved: keep remote", hook);
  } else {
    const uint64_t remote_version = conflict.remote().version();
    oplog_->Requeue(
        op->id(), kind == RESOLUTION_KIND_MERGED ? "resolved: merged" : "resolved: keep local",
        [&](Operation& amended) {
          amended.set_base_version(remote_version);
          if (kind == RESOLUTION_KIND_MERGED) amended.set_payload(merged_value);
        },
        hook);
  }
  if (write) cache_->Publish(*write);

  ledger_->PublishResolved(conflict, resolution);
  return resolution;
}

void SyncCoordinator::PublishSession(EventType type, const SyncOutcome& outcome) const {
  if (!events_) return;
  Event event;
  event.set_type(type);
  event.set_subject_id(outcome.session_id());
  event.set_reason(outcome.error());
  *event.mutable_outcome() = outcome;
  events_->Publish(std::move(event));
}

} // namespace syncore::sync
