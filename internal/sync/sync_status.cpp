#include "sync_status.hpp"

namespace millsync::sync {

std::string_view SyncStateName(SyncState state) {
  switch (state) {
    case SyncState::kIdle:
      return "idle";
    case SyncState::kSyncing:
      return "syncing";
    case SyncState::kSuccess:
      return "success";
    case SyncState::kError:
      return "error";
    case SyncState::kOffline:
      return "offline";
    case SyncState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string_view SyncPhaseName(SyncPhase phase) {
  switch (phase) {
    case SyncPhase::kPreparing:
      return "preparing";
    case SyncPhase::kPushing:
      return "pushing";
    case SyncPhase::kPulling:
      return "pulling";
    case SyncPhase::kFinalizing:
      return "finalizing";
    case SyncPhase::kComplete:
      return "complete";
  }
  return "unknown";
}

template <typename Fn>
void SyncStatusTracker::Mutate(Fn&& fn) {
  SyncStatus            snapshot;
  std::vector<Listener> listeners;
  {
    std::lock_guard lock(mutex_);
    fn(status_);
    snapshot  = status_;
    listeners = listeners_;
  }

  for (const auto& listener : listeners) {
    listener(snapshot);
  }
}

SyncStatus SyncStatusTracker::Snapshot() const {
  std::lock_guard lock(mutex_);
  return status_;
}

void SyncStatusTracker::AddListener(Listener listener) {
  std::lock_guard lock(mutex_);
  listeners_.push_back(std::move(listener));
}

void SyncStatusTracker::BeginPass() {
  Mutate([](SyncStatus& s) {
    s.state = SyncState::kSyncing;
    s.phase = SyncPhase::kPreparing;
    s.last_error.clear();
    s.auth_required = false;
  });
}

void SyncStatusTracker::SetPhase(SyncPhase phase) {
  Mutate([phase](SyncStatus& s) { s.phase = phase; });
}

void SyncStatusTracker::SetCounts(std::size_t pending, std::size_t failed, std::size_t conflict) {
  Mutate([&](SyncStatus& s) {
    s.pending_count  = pending;
    s.failed_count   = failed;
    s.conflict_count = conflict;
  });
}

void SyncStatusTracker::FinishPass(SyncState state, std::string error, std::optional<uint64_t> finished_at_ms, bool auth_required) {
  Mutate([&](SyncStatus& s) {
    s.state         = state;
    s.phase         = SyncPhase::kComplete;
    s.last_error    = std::move(error);
    s.auth_required = auth_required;
    if (finished_at_ms) s.last_sync_at_ms = finished_at_ms;
  });
}

void SyncStatusTracker::SetOnline(bool online) {
  Mutate([online](SyncStatus& s) {
    s.online = online;
    if (!online && s.state != SyncState::kSyncing) {
      s.state = SyncState::kOffline;
    } else if (online && s.state == SyncState::kOffline) {
      s.state = SyncState::kIdle;
    }
  });
}

} // namespace millsync::sync
