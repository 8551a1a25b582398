#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/model/sync_types.hpp"

namespace millsync::sync {

/*
  Per-entity logical lock. A record may only be marked Syncing while it holds
  its entity's lock, so two records of one entity are never in flight
  together.
*/
class EntityLockTable {
 public:
  // Re-acquiring with the same holder succeeds.
  bool TryAcquire(const model::EntityRef& entity, const std::string& holder);

  // No-op unless `holder` owns the lock.
  void Release(const model::EntityRef& entity, const std::string& holder);

  bool IsHeld(const model::EntityRef& entity);

  std::size_t HeldCount();

 private:
  std::mutex                              mutex_;
  std::map<model::EntityRef, std::string> holders_;
};

} // namespace millsync::sync
