#pragma once

#include <atomic>

namespace millsync::util {

/*
  Cooperative cancellation flag shared between the sync worker and the
  transport. Transports poll it and abandon in-flight calls.
*/
class CancelToken {
 public:
  void Cancel() {
    cancelled_.store(true);
  }

  void Reset() {
    cancelled_.store(false);
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace millsync::util
