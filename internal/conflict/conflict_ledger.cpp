#include "internal/conflict/conflict_ledger.hpp"

#include <stdexcept>

#include "internal/conflict/conflict_resolver.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "syncore/v1/status.pb.h"

namespace syncore::conflict {

using namespace syncore::v1;

namespace {

Conflict ParseConflict(const db::model::ConflictRecord& record) {
  Conflict conflict;
  if (!conflict.ParseFromString(record.body)) {
    throw std::runtime_error("conflict ledger: unreadable conflict " + record.id);
  }
  return conflict;
}

} // namespace

ConflictLedger::ConflictLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventBus> events)
    : repository_(std::move(repository)), events_(std::move(events)) {
  if (!repository_) {
    throw std::invalid_argument("conflict ledger requires a repository");
  }
}

void ConflictLedger::Park(db::Transaction& tx, const Conflict& conflict) {
  db::model::ConflictRecord record;
  record.id           = conflict.id();
  record.operation_id = conflict.operation_id();
  record.opened_at_ms = conflict.detected_at_ms();
  if (!conflict.SerializeToString(&record.body)) {
    throw std::runtime_error("conflict ledger: serialize failed for " + conflict.id());
  }
  db::ThrowIfDbError(repository_->UpsertOpenConflict(tx, record), "park conflict");
}

void ConflictLedger::Close(db::Transaction& tx, const std::string& conflict_id) {
  db::ThrowIfDbError(repository_->DeleteOpenConflict(tx, conflict_id), "close conflict");
}

uint64_t ConflictLedger::Audit(db::Transaction& tx, const Conflict& conflict, const Resolution& resolution, bool manual) {
  AuditRecord record;
  *record.mutable_conflict()   = conflict;
  *record.mutable_resolution() = resolution;
  record.set_before_value(conflict.local().value());
  record.set_after_value(resolution.kind() == RESOLUTION_KIND_MANUAL_REQUIRED ? conflict.local().value() : resolution.value());
  record.set_recorded_at_ms(util::ToUnixMillis(util::Now()));
  record.set_manual(manual);

  db::model::AuditRow row;
  row.conflict_id    = conflict.id();
  row.recorded_at_ms = record.recorded_at_ms();
  if (!record.SerializeToString(&row.body)) {
    throw std::runtime_error("conflict ledger: serialize failed for audit of " + conflict.id());
  }
  db::ThrowIfDbError(repository_->AppendAudit(tx, row), "append conflict audit");
  return row.seq;
}

std::vector<Conflict> ConflictLedger::ListOpen() const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListOpenConflicts(*tx);
  tx->Commit();

  std::vector<Conflict> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ParseConflict(record));
  }
  return out;
}

std::optional<Conflict> ConflictLedger::GetOpen(const std::string& conflict_id) const {
  for (auto& conflict : ListOpen()) {
    if (conflict.id() == conflict_id) return conflict;
  }
  return std::nullopt;
}

std::optional<Conflict> ConflictLedger::FindOpenForOperation(const std::string& operation_id) const {
  for (auto& conflict : ListOpen()) {
    if (conflict.operation_id() == operation_id) return conflict;
  }
  return std::nullopt;
}

std::vector<AuditRecord> ConflictLedger::ReadAudit(uint64_t after_seq) const {
  auto tx   = repository_->Begin();
  auto rows = repository_->ReadAudit(*tx, after_seq);
  tx->Commit();

  std::vector<AuditRecord> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    AuditRecord record;
    if (!record.ParseFromString(row.body)) {
      throw std::runtime_error("conflict ledger: unreadable audit record " + std::to_string(row.seq));
    }
    record.set_seq(row.seq);
    out.push_back(std::move(record));
  }
  return out;
}

void ConflictLedger::PublishDetected(const Conflict& conflict) const {
  SYNCORE_LOG_INFO("conflict detected", {observability::StringField("conflict_id", conflict.id()),
                                         observability::StringField("operation_id", conflict.operation_id()),
                                         observability::StringField("key", conflict.key())});
  if (!events_) return;

  Event event;
  event.set_type(EVENT_TYPE_CONFLICT_DETECTED);
  event.set_subject_id(conflict.id());
  event.set_kind(conflict.kind());
  *event.mutable_conflict() = conflict;
  events_->Publish(std::move(event));
}

void ConflictLedger::PublishResolved(const Conflict& conflict, const Resolution& resolution) const {
  SYNCORE_LOG_INFO("conflict resolved", {observability::StringField("conflict_id", conflict.id()),
                                         observability::StringField("rule", RuleName(resolution.rule())),
                                         observability::StringField("resolution", ResolutionName(resolution.kind()))});
  if (!events_) return;

  Event event;
  event.set_type(EVENT_TYPE_CONFLICT_RESOLVED);
  event.set_subject_id(conflict.id());
  event.set_kind(conflict.kind());
  event.set_reason(resolution.reason());
  *event.mutable_resolution() = resolution;
  events_->Publish(std::move(event));
}

} // namespace syncore::conflict
