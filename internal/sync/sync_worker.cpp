#include "sync_worker.hpp"

#include "internal/observability/logging.hpp"

namespace millsync::sync {

SyncWorker::SyncWorker(std::shared_ptr<SyncTriggerQueue> triggers, std::shared_ptr<SyncOrchestrator> orchestrator,
                       std::optional<std::chrono::milliseconds> periodic)
    : triggers_(std::move(triggers)), orchestrator_(std::move(orchestrator)), periodic_(periodic) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::SetPassListener(PassListener listener) {
  listener_ = std::move(listener);
}

void SyncWorker::Start() {
  if (running_.exchange(true)) return;
  stop_.Reset();
  thread_ = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Stop() {
  running_ = false;
  // tripped before Cancel so a pass that starts in between still sees it
  stop_.Cancel();
  orchestrator_->Cancel();
  triggers_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

void SyncWorker::Trigger(SyncTrigger trigger) {
  triggers_->Enqueue(trigger);
}

void SyncWorker::Run() {
  while (running_) {
    auto trigger = triggers_->Dequeue(periodic_);
    if (!trigger || !running_) break;

    if (!online_) {
      MILLSYNC_LOG_DEBUG("Sync skipped while offline", {observability::StringField("trigger", SyncTriggerName(*trigger))});
      continue;
    }

    try {
      const auto result = orchestrator_->RunSyncPass(&stop_);
      if (listener_) listener_(*trigger, result);
    } catch (const std::exception& e) {
      MILLSYNC_LOG_ERROR("Sync worker pass failed", {observability::StringField("trigger", SyncTriggerName(*trigger)),
                                                     observability::StringField("error", e.what())});
    }
  }
}

} // namespace millsync::sync
