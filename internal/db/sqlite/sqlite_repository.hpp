#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"

namespace syncore::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
