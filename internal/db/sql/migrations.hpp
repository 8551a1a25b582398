#pragma once

#include <string>
#include <vector>

namespace millsync::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() plus version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // 0 when no migration has been applied yet.
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

/*
  Runs migrations in order. ordered_sql[i] is schema version i + 1; versions
  already recorded are skipped. Returns the number of migrations applied.
*/

int RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace millsync::db::sql
