#include "sqlite_schema.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace millsync::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int CurrentVersion() override {
    sqlite3_stmt* st = db_.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    int           rc = sqlite3_step(st);
    int version      = rc == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW) {
      throw util::StorageError("read schema version: " + std::string(sqlite3_errmsg(db_.Handle())));
    }
    return version;
  }

  void RecordVersion(int version) override {
    sqlite3_stmt* st = db_.Prepare("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(?, ?);");
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw util::StorageError("record schema version: " + std::string(sqlite3_errmsg(db_.Handle())));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

const std::vector<std::string>& SchemaMigrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: ledger, queue, stock history
      "CREATE TABLE IF NOT EXISTS entity ("
      " entity_type INTEGER NOT NULL, local_id INTEGER NOT NULL, server_id TEXT,"
      " sync_status INTEGER NOT NULL, is_deleted INTEGER NOT NULL DEFAULT 0,"
      " natural_key TEXT NOT NULL DEFAULT '', body BLOB NOT NULL,"
      " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY (entity_type, local_id));"
      "CREATE TABLE IF NOT EXISTS stock_movement ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT, item_local_id INTEGER NOT NULL, kind INTEGER NOT NULL,"
      " quantity_delta REAL NOT NULL, bags_delta INTEGER NOT NULL, unit_price REAL NOT NULL,"
      " reference TEXT NOT NULL DEFAULT '', note TEXT NOT NULL DEFAULT '', recorded_at_ms INTEGER NOT NULL);"
      "CREATE TABLE IF NOT EXISTS sync_queue ("
      " id TEXT PRIMARY KEY, sequence INTEGER NOT NULL UNIQUE,"
      " entity_type INTEGER NOT NULL, entity_id INTEGER NOT NULL, entity_server_id TEXT,"
      " operation INTEGER NOT NULL, status INTEGER NOT NULL, priority INTEGER NOT NULL,"
      " payload BLOB NOT NULL, depends_on TEXT NOT NULL DEFAULT '', error_message TEXT NOT NULL DEFAULT '',"
      " retry_count INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL DEFAULT 3,"
      " last_attempt_at_ms INTEGER, next_retry_at_ms INTEGER,"
      " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);"
      "CREATE TABLE IF NOT EXISTS id_sequence (name TEXT PRIMARY KEY, value INTEGER NOT NULL);",

      // 2: lookup indexes and pull cursors
      "CREATE INDEX IF NOT EXISTS entity_server_id_idx ON entity(entity_type, server_id);"
      "CREATE INDEX IF NOT EXISTS entity_natural_key_idx ON entity(entity_type, natural_key);"
      "CREATE INDEX IF NOT EXISTS sync_queue_entity_idx ON sync_queue(entity_type, entity_id, sequence);"
      "CREATE INDEX IF NOT EXISTS sync_queue_status_idx ON sync_queue(status);"
      "CREATE INDEX IF NOT EXISTS stock_movement_item_idx ON stock_movement(item_local_id, id);"
      "CREATE TABLE IF NOT EXISTS sync_cursor (scope TEXT PRIMARY KEY, value_ms INTEGER NOT NULL);",
  };
  return kMigrations;
}

int ApplySchema(SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  std::lock_guard          lock(db.TxMutex());
  SqliteMigrationExecutor executor(db);

  db.Exec("BEGIN IMMEDIATE;");
  try {
    const int applied = sql::RunMigrations(executor, SchemaMigrations());
    db.Exec("COMMIT;");
    return applied;
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }
}

} // namespace millsync::db::sqlite
