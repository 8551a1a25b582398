#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <thread>

#include "internal/sync/sync_orchestrator.hpp"
#include "internal/sync/sync_trigger_queue.hpp"

namespace millsync::sync {

/*
  Background thread that runs sync passes.

  Runs one pass per trigger, plus one per idle period when a periodic
  interval is set. Passes are skipped while the device reports no
  connectivity. Stop cancels the pass in flight and joins.
*/
class SyncWorker {
 public:
  using PassListener = std::function<void(SyncTrigger, const SyncPassResult&)>;

  SyncWorker(std::shared_ptr<SyncTriggerQueue> triggers, std::shared_ptr<SyncOrchestrator> orchestrator,
             std::optional<std::chrono::milliseconds> periodic = std::nullopt);
  ~SyncWorker();

  void Start();
  void Stop();

  void Trigger(SyncTrigger trigger);

  void SetOnline(bool online) {
    online_ = online;
  }

  bool IsOnline() const {
    return online_.load();
  }

  // Called on the worker thread after every pass.
  void SetPassListener(PassListener listener);

 private:
  void Run();

  std::shared_ptr<SyncTriggerQueue>        triggers_;
  std::shared_ptr<SyncOrchestrator>        orchestrator_;
  std::optional<std::chrono::milliseconds> periodic_;
  PassListener                             listener_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> online_{true};
  util::CancelToken stop_;
};

} // namespace millsync::sync
