#pragma once

#include <string>
#include <vector>

namespace syncore::db::sql {

/*
  Versioned schema of the local store.

  The store records the last applied version; opening it applies every newer
  migration, each atomically. A store written by a newer build is refused
  rather than silently downgraded.
*/

struct Migration {
  int                      version;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
  virtual int  SchemaVersion()                    = 0;
  virtual void SetSchemaVersion(int version)      = 0;
};

// In ascending version order.
const std::vector<Migration>& SchemaMigrations();

// Returns the version the store is at afterwards.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& migrations);

} // namespace syncore::db::sql
