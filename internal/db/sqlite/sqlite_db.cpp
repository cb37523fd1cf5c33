#include "internal/db/sqlite/sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace syncore::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

// Runs a single-row pragma and returns its first column as text.
std::string QueryPragma(sqlite3* db, const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr), db, std::string("sqlite prepare ") + sql);

  std::string value;
  const int   rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const unsigned char* text = sqlite3_column_text(stmt, 0);
    value                     = text ? reinterpret_cast<const char*>(text) : "";
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step ") + sql + ": " + sqlite3_errmsg(db));
  }
  return value;
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
    CheckIntegrity();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::SchemaVersion() {
  return std::stoi(QueryPragma(db_, "PRAGMA user_version;"));
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // the operation journal is the crash-recovery source of truth
  Exec("PRAGMA synchronous=FULL;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::CheckIntegrity() {
  const auto result = QueryPragma(db_, "PRAGMA quick_check;");
  if (result != "ok") {
    throw util::CorruptionDetected(path_, "local store failed integrity check: " + result);
  }
}

} // namespace syncore::db::sqlite
