#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace millsync::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const int current = executor.CurrentVersion();
  int       applied = 0;

  for (int version = current + 1; version <= static_cast<int>(ordered_sql.size()); ++version) {
    executor.ExecuteSQL(ordered_sql[version - 1]);
    executor.RecordVersion(version);
    ++applied;
    MILLSYNC_LOG_INFO("Applied schema migration", {observability::IntField("version", version)});
  }

  return applied;
}

} // namespace millsync::db::sql
