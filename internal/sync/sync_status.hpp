#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace millsync::sync {

enum class SyncState { kIdle, kSyncing, kSuccess, kError, kOffline, kCancelled };

enum class SyncPhase { kPreparing, kPushing, kPulling, kFinalizing, kComplete };

std::string_view SyncStateName(SyncState state);
std::string_view SyncPhaseName(SyncPhase phase);

struct SyncStatus {
  SyncState state  = SyncState::kIdle;
  SyncPhase phase  = SyncPhase::kComplete;
  bool      online = true;

  std::optional<uint64_t> last_sync_at_ms;

  std::size_t pending_count  = 0;
  std::size_t failed_count   = 0;
  std::size_t conflict_count = 0;

  bool        auth_required = false;
  std::string last_error;
};

/*
  Observable sync status. Listeners run on the thread that changed the
  status, after the internal lock is released.
*/
class SyncStatusTracker {
 public:
  using Listener = std::function<void(const SyncStatus&)>;

  SyncStatus Snapshot() const;

  void AddListener(Listener listener);

  void BeginPass();

  void SetPhase(SyncPhase phase);

  void SetCounts(std::size_t pending, std::size_t failed, std::size_t conflict);

  void FinishPass(SyncState state, std::string error, std::optional<uint64_t> finished_at_ms, bool auth_required);

  void SetOnline(bool online);

 private:
  template <typename Fn>
  void Mutate(Fn&& fn);

  mutable std::mutex    mutex_;
  SyncStatus            status_;
  std::vector<Listener> listeners_;
};

} // namespace millsync::sync
