#include "sync_trigger_queue.hpp"

#include <algorithm>

namespace millsync::sync {

std::string_view SyncTriggerName(SyncTrigger trigger) {
  switch (trigger) {
    case SyncTrigger::kExplicit:
      return "explicit";
    case SyncTrigger::kConnectivityRestored:
      return "connectivity";
    case SyncTrigger::kAppResumed:
      return "resumed";
    case SyncTrigger::kPeriodic:
      return "periodic";
  }
  return "unknown";
}

void SyncTriggerQueue::Enqueue(SyncTrigger trigger) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    if (std::find(queue_.begin(), queue_.end(), trigger) != queue_.end()) return;
    queue_.push_back(trigger);
  }
  cv_.notify_one();
}

std::optional<SyncTrigger> SyncTriggerQueue::Dequeue(std::optional<std::chrono::milliseconds> timeout) {
  std::unique_lock lock(mutex_);

  auto ready = [&] { return shutdown_ || !queue_.empty(); };

  if (timeout) {
    if (!cv_.wait_for(lock, *timeout, ready)) {
      return SyncTrigger::kPeriodic;
    }
  } else {
    cv_.wait(lock, ready);
  }

  if (shutdown_) return std::nullopt;

  SyncTrigger trigger = queue_.front();
  queue_.pop_front();
  return trigger;
}

void SyncTriggerQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    queue_.clear();
  }
  cv_.notify_all();
}

} // namespace millsync::sync
