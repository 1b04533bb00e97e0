#pragma once

#include <string>
#include <vector>

namespace tally::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; RunMigrations applies every
  migration newer than AppliedVersion() in order and records it.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // 0 when no migration has been applied
  virtual int AppliedVersion() = 0;

  virtual void MarkApplied(int version) = 0;
};

struct Migration {
  int                      version = 0;
  std::vector<std::string> statements;
};

// Ordered by version.
const std::vector<Migration>& LocalStoreMigrations();

// Returns the number of migrations applied.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace tally::db::sql
