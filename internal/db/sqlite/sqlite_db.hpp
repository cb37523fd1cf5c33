#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace syncore::db::sqlite {

/*
  Owns the single sqlite3 connection of the local store.

  Every component shares it; TransactionLock() serializes transactions on it
  (sqlite has no nested BEGIN on a single connection). Opening runs a quick
  integrity check so a damaged file is reported before any journal replay.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }
  int  SchemaVersion() override;
  void SetSchemaVersion(int version) override;

  std::unique_lock<std::mutex> TransactionLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void Configure(bool wal_mode);
  void CheckIntegrity();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace syncore::db::sqlite
