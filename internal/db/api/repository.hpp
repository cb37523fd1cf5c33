#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_record.hpp"
#include "internal/db/model/conflict_record.hpp"
#include "internal/db/model/journal_record.hpp"

namespace syncore::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Journal sequence numbers are assigned at append and strictly increase
  - The journal and conflict audit tables are append-only (the journal is
    only ever truncated up to a committed checkpoint)

  The DB is the source of truth for:
    operation journal + checkpoints
    cache segments + quarantine
    delta cursor
    open conflicts + audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Operation journal
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result AppendJournal(Transaction&, model::JournalRecord& record) = 0;

  virtual std::vector<model::JournalRecord> ReadJournal(Transaction&, uint64_t after_seq) = 0;

  virtual Result TruncateJournal(Transaction&, uint64_t up_to_seq) = 0;

  virtual Result PutCheckpoint(Transaction&, const model::CheckpointRecord&) = 0;

  virtual std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Cache segments
  // ---------------------------------------------------------------------

  virtual Result UpsertCacheEntry(Transaction&, const model::CacheRecord&) = 0;

  virtual Result DeleteCacheEntry(Transaction&, const std::string& key) = 0;

  virtual std::vector<model::CacheRecord> ListCacheEntries(Transaction&) = 0;

  virtual Result InsertQuarantine(Transaction&, const model::QuarantineRow&) = 0;

  virtual std::vector<model::QuarantineRow> ListQuarantine(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Sync state (delta cursor)
  // ---------------------------------------------------------------------

  virtual Result PutSyncState(Transaction&, const std::string& name, const std::string& value) = 0;

  virtual std::optional<std::string> GetSyncState(Transaction&, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Conflicts
  // ---------------------------------------------------------------------

  virtual Result UpsertOpenConflict(Transaction&, const model::ConflictRecord&) = 0;

  virtual Result DeleteOpenConflict(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ConflictRecord> ListOpenConflicts(Transaction&) = 0;

  // Assigns record.seq.
  virtual Result AppendAudit(Transaction&, model::AuditRow& record) = 0;

  virtual std::vector<model::AuditRow> ReadAudit(Transaction&, uint64_t after_seq) = 0;
};

} // namespace syncore::db
