#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace syncore::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front, so a journal append never
  fails halfway through a session with SQLITE_BUSY. The connection's
  transaction lock is held for the whole lifetime.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         finished_ = false;
};

} // namespace syncore::db::sqlite
