#include "internal/db/memory/memory_repository.hpp"

#include <algorithm>

#include "internal/db/memory/memory_tx.hpp"

namespace syncore::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Operation journal
// ------------------------------------------------------------------

Result MemoryRepository::AppendJournal(Transaction& t, model::JournalRecord& r) {
  auto& s = TX(t).Mutable();
  r.seq   = s.next_journal_seq++;
  s.journal.emplace(r.seq, r);
  return Result::Ok();
}

std::vector<model::JournalRecord> MemoryRepository::ReadJournal(Transaction& t, uint64_t after_seq) {
  const auto&                       s = TX(t).View();
  std::vector<model::JournalRecord> out;
  for (auto it = s.journal.upper_bound(after_seq); it != s.journal.end(); ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::TruncateJournal(Transaction& t, uint64_t up_to_seq) {
  auto& s = TX(t).Mutable();
  s.journal.erase(s.journal.begin(), s.journal.upper_bound(up_to_seq));
  return Result::Ok();
}

Result MemoryRepository::PutCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  TX(t).Mutable().checkpoint = r;
  return Result::Ok();
}

std::optional<model::CheckpointRecord> MemoryRepository::GetCheckpoint(Transaction& t) {
  return TX(t).View().checkpoint;
}

// ------------------------------------------------------------------
// Cache segments
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCacheEntry(Transaction& t, const model::CacheRecord& r) {
  TX(t).Mutable().cache[r.key] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  TX(t).Mutable().cache.erase(key);
  return Result::Ok();
}

std::vector<model::CacheRecord> MemoryRepository::ListCacheEntries(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::CacheRecord> out;
  out.reserve(s.cache.size());
  for (const auto& [_, record] : s.cache) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::InsertQuarantine(Transaction& t, const model::QuarantineRow& r) {
  TX(t).Mutable().quarantine.push_back(r);
  return Result::Ok();
}

std::vector<model::QuarantineRow> MemoryRepository::ListQuarantine(Transaction& t) {
  return TX(t).View().quarantine;
}

// ------------------------------------------------------------------
// Sync state
// ------------------------------------------------------------------

Result MemoryRepository::PutSyncState(Transaction& t, const std::string& name, const std::string& value) {
  TX(t).Mutable().sync_state[name] = value;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetSyncState(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.sync_state.find(name);
  if (it == s.sync_state.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Conflicts
// ------------------------------------------------------------------

Result MemoryRepository::UpsertOpenConflict(Transaction& t, const model::ConflictRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.open_conflicts.find(r.id);
  if (it == s.open_conflicts.end()) {
    s.open_conflicts.emplace(r.id, r);
    return Result::Ok();
  }
  // opened_at_ms is fixed by the first write
  it->second.operation_id = r.operation_id;
  it->second.body         = r.body;
  return Result::Ok();
}

Result MemoryRepository::DeleteOpenConflict(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().open_conflicts.erase(id) == 0) {
    return Result::Err(ErrorCode::NotFound, "conflict not found: " + id);
  }
  return Result::Ok();
}

std::vector<model::ConflictRecord> MemoryRepository::ListOpenConflicts(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::ConflictRecord> out;
  out.reserve(s.open_conflicts.size());
  for (const auto& [_, record] : s.open_conflicts) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.opened_at_ms != b.opened_at_ms) return a.opened_at_ms < b.opened_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::AppendAudit(Transaction& t, model::AuditRow& r) {
  auto& s = TX(t).Mutable();
  r.seq   = s.next_audit_seq++;
  s.audit.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRow> MemoryRepository::ReadAudit(Transaction& t, uint64_t after_seq) {
  const auto&                  s = TX(t).View();
  std::vector<model::AuditRow> out;
  for (const auto& row : s.audit) {
    if (row.seq > after_seq) out.push_back(row);
  }
  return out;
}

}
