#include "internal/db/sqlite/sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace syncore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TransactionLock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    SYNCORE_LOG_ERROR("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                                 observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("transaction already finished");
  }
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    // a failed COMMIT leaves the transaction open; the destructor rolls it back
    SYNCORE_LOG_ERROR("sqlite commit failed", {observability::StringField("path", db_->Path()),
                                               observability::StringField("error", e.what())});
    throw;
  }
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace syncore::db::sqlite
