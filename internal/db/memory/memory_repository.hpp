#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace syncore::db::memory {

class MemoryTransaction;

/*
  In-process repository for tests and ephemeral agents.

  Committed state is replaced wholesale on Commit(); a repository-wide lock
  is held by the open transaction so writers never interleave.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result AppendJournal(Transaction&, model::JournalRecord&) override;
  std::vector<model::JournalRecord> ReadJournal(Transaction&, uint64_t after_seq) override;
  Result TruncateJournal(Transaction&, uint64_t up_to_seq) override;
  Result PutCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&) override;

  Result UpsertCacheEntry(Transaction&, const model::CacheRecord&) override;
  Result DeleteCacheEntry(Transaction&, const std::string& key) override;
  std::vector<model::CacheRecord> ListCacheEntries(Transaction&) override;
  Result InsertQuarantine(Transaction&, const model::QuarantineRow&) override;
  std::vector<model::QuarantineRow> ListQuarantine(Transaction&) override;

  Result PutSyncState(Transaction&, const std::string& name, const std::string& value) override;
  std::optional<std::string> GetSyncState(Transaction&, const std::string& name) override;

  Result UpsertOpenConflict(Transaction&, const model::ConflictRecord&) override;
  Result DeleteOpenConflict(Transaction&, const std::string& id) override;
  std::vector<model::ConflictRecord> ListOpenConflicts(Transaction&) override;
  Result AppendAudit(Transaction&, model::AuditRow&) override;
  std::vector<model::AuditRow> ReadAudit(Transaction&, uint64_t after_seq) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::JournalRecord> journal;
    uint64_t next_journal_seq = 1;
    std::optional<model::CheckpointRecord> checkpoint;

    std::unordered_map<std::string, model::CacheRecord> cache;
    std::vector<model::QuarantineRow> quarantine;

    std::unordered_map<std::string, std::string> sync_state;

    std::unordered_map<std::string, model::ConflictRecord> open_conflicts;
    std::vector<model::AuditRow> audit;
    uint64_t next_audit_seq = 1;
  };

  std::mutex tx_mutex_;
  std::mutex mutex_;
  State committed_;
};

}
