#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>

namespace millsync::sync {

enum class SyncTrigger {
  kExplicit,
  kConnectivityRestored,
  kAppResumed,
  kPeriodic,
};

std::string_view SyncTriggerName(SyncTrigger trigger);

/*
  Thread-safe blocking queue of sync requests. A trigger already waiting is
  not queued twice.
*/
class SyncTriggerQueue {
 public:
  void Enqueue(SyncTrigger trigger);

  // Blocks until a trigger arrives or shutdown. With a timeout, an idle wait
  // yields kPeriodic.
  std::optional<SyncTrigger> Dequeue(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<SyncTrigger> queue_;
  bool                    shutdown_ = false;
};

} // namespace millsync::sync
