#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/ledger/entity_ledger.hpp"
#include "internal/remote/remote_api.hpp"
#include "internal/sync/entity_lock_table.hpp"
#include "internal/sync/failure_classifier.hpp"
#include "internal/sync/pull_merger.hpp"
#include "internal/sync/reconciler.hpp"
#include "internal/sync/sync_queue.hpp"
#include "internal/sync/sync_status.hpp"
#include "internal/util/cancel_token.hpp"
#include "internal/util/failure.hpp"

namespace millsync::sync {

struct SyncOptions {
  std::size_t batch_size           = 50;
  std::size_t max_records_per_pass = 500;
  bool        use_batch_endpoints  = true;
  bool        pull_enabled         = true;
};

struct SyncPassResult {
  bool already_running = false;
  bool auth_required   = false;
  // the server could not be reached at all
  bool unreachable = false;

  std::size_t recovered  = 0;
  std::size_t healed     = 0;
  std::size_t attempted  = 0;
  std::size_t succeeded  = 0;
  std::size_t failed     = 0;
  std::size_t retried    = 0;
  std::size_t conflicted = 0;
  std::size_t deferred   = 0;
  std::size_t cancelled  = 0;
  std::size_t pulled     = 0;

  std::vector<std::string> errors;

  bool Ok() const {
    return !already_running && !auth_required && failed == 0 && conflicted == 0 && cancelled == 0 && errors.empty();
  }
};

/*
  Drains the sync queue against the server.

  RunSyncPass never throws: every per-record outcome becomes a state
  transition and every pass-level problem lands in SyncPassResult::errors.
  Passes never overlap; a call made while one runs returns already_running.
  No repository transaction is held across a remote call.
*/
class SyncOrchestrator {
 public:
  SyncOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::EntityLedger> ledger, std::shared_ptr<SyncQueue> queue,
                   std::shared_ptr<Reconciler> reconciler, std::shared_ptr<PullMerger> puller, std::shared_ptr<remote::RemoteApi> remote,
                   std::shared_ptr<SyncStatusTracker> status, std::shared_ptr<util::Clock> clock, SyncOptions options);

  // A tripped `stop` cancels the pass even when it trips before the pass starts.
  SyncPassResult RunSyncPass(const util::CancelToken* stop = nullptr);

  // Abandons the running pass; in-flight records return to Pending.
  void Cancel();

  // Resolves a Failed or Conflict record in favour of the server: fetches the
  // entity's server copy, stores it over the local row and drops the queued
  // snapshots and deletes it supersedes. Stock movements stay queued. Waits for a running pass to finish.
  util::Outcome<bool> KeepServerCopy(const std::string& record_id);

  bool IsRunning() const {
    return running_.load();
  }

  // Startup crash recovery: Syncing -> Pending.
  std::size_t RecoverInFlight();

  const SyncOptions& options() const {
    return options_;
  }

 private:
  struct InFlight {
    db::model::MutationRecord     record;
    millsync::v1::MutationPayload outbound;
  };

  std::size_t SelfHeal();

  void Push(SyncPassResult& result);

  std::vector<InFlight> Claim(std::set<std::string>& attempted, std::set<std::string>& deferred, std::size_t budget, SyncPassResult& result);

  void Transmit(std::vector<InFlight>& round, SyncPassResult& result);

  void SendOne(const InFlight& item, SyncPassResult& result);

  void SendBatch(model::EntityType type, const std::vector<const InFlight*>& group, SyncPassResult& result);

  void Settle(const InFlight& item, Classification outcome, const millsync::v1::SyncedEntity& ack, const std::string& detail, SyncPassResult& result);

  void ReturnUnsent(const InFlight& item, bool cancelled, SyncPassResult& result);

  void Pull(SyncPassResult& result);

  void Finish(SyncPassResult& result);

  bool ShouldStop(const SyncPassResult& result) const;

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<ledger::EntityLedger> ledger_;
  std::shared_ptr<SyncQueue>            queue_;
  std::shared_ptr<Reconciler>           reconciler_;
  std::shared_ptr<PullMerger>           puller_;
  std::shared_ptr<remote::RemoteApi>    remote_;
  std::shared_ptr<SyncStatusTracker>    status_;
  std::shared_ptr<util::Clock>          clock_;
  SyncOptions                           options_;

  std::mutex        pass_mutex_;
  std::atomic<bool> running_{false};
  util::CancelToken cancel_;
  EntityLockTable   locks_;
};

} // namespace millsync::sync
