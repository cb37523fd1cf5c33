#include "internal/service/sync_service.hpp"

#include <stdexcept>

#include "internal/cache/cache_store.hpp"
#include "internal/conflict/conflict_ledger.hpp"
#include "internal/oplog/operation_log.hpp"
#include "internal/sync/sync_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace syncore::service {

SyncService::SyncService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.oplog || !ctx_.cache || !ctx_.ledger || !ctx_.coordinator || !ctx_.events) {
    throw std::invalid_argument("sync service: incomplete service context");
  }
}

std::string SyncService::Enqueue(const EnqueueRequest& request) {
  syncore::v1::Operation op;
  op.set_id(request.id.empty() ? util::NewId() : request.id);
  op.set_kind(request.kind);
  op.set_priority(request.priority);
  op.set_payload(request.payload);
  for (const auto& dependency : request.depends_on) {
    op.add_depends_on(dependency);
  }
  op.set_target_key(request.target_key);
  op.set_origin_role(request.origin_role);
  op.set_requires_review(request.requires_review);

  if (request.base_version) {
    op.set_base_version(*request.base_version);
  } else if (!request.target_key.empty()) {
    op.set_base_version(ctx_.cache->Version(request.target_key).value_or(0));
  }
  if (request.ttl && request.ttl->count() > 0) {
    op.set_expires_at_ms(util::ToUnixMillis(util::Now() + *request.ttl));
  }

  return ctx_.oplog->Enqueue(std::move(op));
}

bool SyncService::Cancel(const std::string& id) {
  return ctx_.oplog->Cancel(id);
}

syncore::v1::QueueSnapshot SyncService::Status() const {
  auto snapshot = ctx_.oplog->PeekStatus();
  snapshot.set_paused(ctx_.coordinator->QueuePaused());
  return snapshot;
}

std::vector<syncore::v1::Operation> SyncService::ListOperations() const {
  return ctx_.oplog->ListOperations();
}

std::optional<syncore::v1::Tombstone> SyncService::Outcome(const std::string& id) const {
  return ctx_.oplog->GetTombstone(id);
}

syncore::v1::SyncOutcome SyncService::Sync(std::optional<uint32_t> max_batch) {
  return ctx_.coordinator->RunSession(max_batch);
}

bool SyncService::CancelSync() {
  return ctx_.coordinator->CancelSession();
}

std::vector<syncore::v1::Conflict> SyncService::OpenConflicts() const {
  return ctx_.ledger->ListOpen();
}

syncore::v1::Resolution SyncService::ResolveConflict(const std::string& conflict_id, syncore::v1::ResolutionKind kind,
                                                     const std::string& merged_value) {
  return ctx_.coordinator->ResolveConflict(conflict_id, kind, merged_value);
}

std::vector<syncore::v1::AuditRecord> SyncService::Audit(uint64_t after_seq) const {
  return ctx_.ledger->ReadAudit(after_seq);
}

syncore::v1::CacheStats SyncService::CacheStatus() const {
  return ctx_.cache->Stats();
}

std::vector<syncore::v1::CacheEntryInfo> SyncService::QueryCache(const syncore::v1::CacheQuery& query) const {
  return ctx_.cache->Query(query);
}

void SyncService::PauseQueue() {
  ctx_.coordinator->SetQueuePaused(true);
}

void SyncService::ResumeQueue() {
  ctx_.coordinator->SetQueuePaused(false);
}

bool SyncService::QueuePaused() const {
  return ctx_.coordinator->QueuePaused();
}

std::vector<std::string> SyncService::CompactCache() {
  return ctx_.cache->Compact();
}

uint64_t SyncService::Subscribe(events::EventBus::Handler handler) {
  return ctx_.events->Subscribe(std::move(handler));
}

void SyncService::Unsubscribe(uint64_t handle) {
  ctx_.events->Unsubscribe(handle);
}

void SyncService::Checkpoint() {
  ctx_.oplog->Checkpoint();
}

} // namespace syncore::service
