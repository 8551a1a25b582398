#include "factory.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace millsync::factory {

namespace {

constexpr uint32_t    kDefaultMaxRetries       = 3;
constexpr std::size_t kDefaultBatchSize        = 50;
constexpr std::size_t kDefaultMaxRecordsPerPass = 500;

std::shared_ptr<db::Repository> BuildRepository(const millsync::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());

    const int applied = db::sqlite::ApplySchema(*sqlite_db);
    MILLSYNC_LOG_INFO("Opened sqlite store", {observability::StringField("path", database.sqlite().path()),
                                              observability::IntField("migrations_applied", applied)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::optional<std::chrono::milliseconds> PeriodicInterval(const millsync::runtime::config::SyncConfig& config) {
  if (config.periodic_interval().empty()) return std::nullopt;

  const auto interval = util::ParseDuration(config.periodic_interval());
  if (interval.count() <= 0) return std::nullopt;
  return interval;
}

} // namespace

sync::SyncOptions SyncOptionsFrom(const millsync::runtime::config::SyncConfig& config) {
  sync::SyncOptions options;
  options.batch_size           = config.batch_size() > 0 ? config.batch_size() : kDefaultBatchSize;
  options.max_records_per_pass = config.max_records_per_pass() > 0 ? config.max_records_per_pass() : kDefaultMaxRecordsPerPass;
  options.use_batch_endpoints  = config.has_use_batch_endpoints() ? config.use_batch_endpoints() : true;
  options.pull_enabled         = config.has_pull_enabled() ? config.pull_enabled() : true;
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const millsync::runtime::config::RuntimeConfig& config, std::shared_ptr<remote::RemoteApi> remote, Overrides overrides) {
  if (!remote) {
    throw std::invalid_argument("Build requires a RemoteApi");
  }

  Application app;

  // ------------------------------------------------------------------
  // Local store
  // ------------------------------------------------------------------
  app.repository = overrides.repository ? overrides.repository : BuildRepository(config);
  app.clock      = overrides.clock ? overrides.clock : std::make_shared<util::WallClock>();
  auto ids       = overrides.ids ? overrides.ids : std::make_shared<util::UuidGenerator>();

  app.ledger = std::make_shared<ledger::EntityLedger>(app.repository, app.clock);
  app.stock  = std::make_shared<ledger::StockLedger>(app.ledger, app.repository, app.clock);

  // ------------------------------------------------------------------
  // Sync engine
  // ------------------------------------------------------------------
  const auto& sync_config = config.sync();
  const auto  max_retries = sync_config.max_retries() > 0 ? sync_config.max_retries() : kDefaultMaxRetries;

  app.queue        = std::make_shared<sync::SyncQueue>(app.repository, app.clock, ids, max_retries);
  app.reconciler   = std::make_shared<sync::Reconciler>(app.ledger, app.queue, app.clock, sync_config.purge_synced());
  app.puller       = std::make_shared<sync::PullMerger>(app.repository, app.ledger, app.queue);
  app.status       = std::make_shared<sync::SyncStatusTracker>();
  app.orchestrator = std::make_shared<sync::SyncOrchestrator>(app.repository, app.ledger, app.queue, app.reconciler, app.puller, std::move(remote),
                                                              app.status, app.clock, SyncOptionsFrom(sync_config));

  app.triggers = std::make_shared<sync::SyncTriggerQueue>();
  app.worker   = std::make_shared<sync::SyncWorker>(app.triggers, app.orchestrator, PeriodicInterval(sync_config));

  // ------------------------------------------------------------------
  // Service
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = app.repository;
  ctx.ledger       = app.ledger;
  ctx.stock        = app.stock;
  ctx.queue        = app.queue;
  ctx.reconciler   = app.reconciler;
  ctx.orchestrator = app.orchestrator;
  ctx.status       = app.status;
  ctx.worker       = app.worker;
  ctx.clock        = app.clock;
  ctx.device_id    = config.device().device_id();

  app.service = std::make_shared<service::MillService>(std::move(ctx));

  // a crash may have left records mid-flight
  app.orchestrator->RecoverInFlight();

  return app;
}

} // namespace millsync::factory
