#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/entity_ledger.hpp"
#include "internal/ledger/stock_ledger.hpp"
#include "internal/remote/remote_api.hpp"
#include "internal/service/mill_service.hpp"
#include "internal/sync/pull_merger.hpp"
#include "internal/sync/reconciler.hpp"
#include "internal/sync/sync_orchestrator.hpp"
#include "internal/sync/sync_queue.hpp"
#include "internal/sync/sync_status.hpp"
#include "internal/sync/sync_trigger_queue.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace millsync::factory {

/*
  Application

  Owns every long-lived component of one device. The worker is built but
  not started; callers decide whether sync runs in the background.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<util::Clock>             clock;
  std::shared_ptr<ledger::EntityLedger>    ledger;
  std::shared_ptr<ledger::StockLedger>     stock;
  std::shared_ptr<sync::SyncQueue>         queue;
  std::shared_ptr<sync::Reconciler>        reconciler;
  std::shared_ptr<sync::PullMerger>        puller;
  std::shared_ptr<sync::SyncStatusTracker> status;
  std::shared_ptr<sync::SyncOrchestrator>  orchestrator;
  std::shared_ptr<sync::SyncTriggerQueue>  triggers;
  std::shared_ptr<sync::SyncWorker>        worker;
  std::shared_ptr<service::MillService>    service;
};

// Optional seams for tests; anything left null gets the production default.
struct Overrides {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<util::Clock>       clock;
  std::shared_ptr<util::IdGenerator> ids;
};

sync::SyncOptions SyncOptionsFrom(const millsync::runtime::config::SyncConfig& config);

/*
  Build

  Composition root. The only place that knows the concrete repository
  backend.
*/
Application Build(const millsync::runtime::config::RuntimeConfig& config, std::shared_ptr<remote::RemoteApi> remote, Overrides overrides = {});

} // namespace millsync::factory
