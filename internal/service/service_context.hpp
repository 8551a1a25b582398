#pragma once

#include <memory>
#include <string>

namespace millsync::db {
class Repository;
}
namespace millsync::ledger {
class EntityLedger;
class StockLedger;
} // namespace millsync::ledger
namespace millsync::sync {
class SyncQueue;
class Reconciler;
class SyncOrchestrator;
class SyncStatusTracker;
class SyncWorker;
} // namespace millsync::sync
namespace millsync::util {
class Clock;
}

namespace millsync::service {

/*
  Dependency container for the Mill Service.
*/
struct ServiceContext {
  std::shared_ptr<millsync::db::Repository>        repository;
  std::shared_ptr<millsync::ledger::EntityLedger>  ledger;
  std::shared_ptr<millsync::ledger::StockLedger>   stock;
  std::shared_ptr<millsync::sync::SyncQueue>       queue;
  std::shared_ptr<millsync::sync::Reconciler>      reconciler;
  std::shared_ptr<millsync::sync::SyncOrchestrator> orchestrator;
  std::shared_ptr<millsync::sync::SyncStatusTracker> status;
  // optional; without it sync only runs through SyncNow
  std::shared_ptr<millsync::sync::SyncWorker> worker;
  std::shared_ptr<millsync::util::Clock>      clock;

  // prefixes transaction numbers so two devices never mint the same one
  std::string device_id;
};

} // namespace millsync::service
