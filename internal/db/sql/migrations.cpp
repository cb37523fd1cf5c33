#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace syncore::db::sql {

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {"CREATE TABLE IF NOT EXISTS op_journal (seq INTEGER PRIMARY KEY AUTOINCREMENT, op_id TEXT NOT NULL, entry_type INTEGER NOT NULL, "
        "body BLOB NOT NULL, appended_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS op_checkpoint (id INTEGER PRIMARY KEY CHECK (id = 1), last_seq INTEGER NOT NULL, body BLOB NOT NULL, "
        "taken_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS cache_entries (key TEXT PRIMARY KEY, body BLOB NOT NULL, updated_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS cache_quarantine (key TEXT NOT NULL, body BLOB NOT NULL, reason TEXT NOT NULL, quarantined_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS sync_state (name TEXT PRIMARY KEY, value BLOB NOT NULL);"}},
      {2,
       {"CREATE TABLE IF NOT EXISTS open_conflicts (id TEXT PRIMARY KEY, operation_id TEXT NOT NULL, body BLOB NOT NULL, opened_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS conflict_audit (seq INTEGER PRIMARY KEY AUTOINCREMENT, conflict_id TEXT NOT NULL, body BLOB NOT NULL, "
        "recorded_at_ms INTEGER NOT NULL);",
        "CREATE INDEX IF NOT EXISTS idx_open_conflicts_operation ON open_conflicts(operation_id);"}},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations) {
  int       current = executor.SchemaVersion();
  const int latest  = migrations.empty() ? 0 : migrations.back().version;
  if (current > latest) {
    throw std::runtime_error("local store schema version " + std::to_string(current) + " is newer than supported version " +
                             std::to_string(latest));
  }

  for (const auto& migration : migrations) {
    if (migration.version <= current) {
      continue;
    }

    executor.ExecuteSQL("BEGIN IMMEDIATE;");
    try {
      for (const auto& sql : migration.statements) {
        executor.ExecuteSQL(sql);
      }
      executor.SetSchemaVersion(migration.version);
      executor.ExecuteSQL("COMMIT;");
    } catch (const std::exception& e) {
      SYNCORE_LOG_ERROR("schema migration failed", {observability::IntField("version", migration.version),
                                                    observability::StringField("error", e.what())});
      executor.ExecuteSQL("ROLLBACK;");
      throw;
    }

    current = migration.version;
    SYNCORE_LOG_INFO("schema migration applied", {observability::IntField("version", migration.version)});
  }
  return current;
}

} // namespace syncore::db::sql
