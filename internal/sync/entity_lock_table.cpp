#include "entity_lock_table.hpp"

namespace millsync::sync {

bool EntityLockTable::TryAcquire(const model::EntityRef& entity, const std::string& holder) {
  std::lock_guard lock(mutex_);

  auto [it, inserted] = holders_.try_emplace(entity, holder);
  return inserted || it->second == holder;
}

void EntityLockTable::Release(const model::EntityRef& entity, const std::string& holder) {
  std::lock_guard lock(mutex_);

  auto it = holders_.find(entity);
  if (it != holders_.end() && it->second == holder) {
    holders_.erase(it);
  }
}

bool EntityLockTable::IsHeld(const model::EntityRef& entity) {
  std::lock_guard lock(mutex_);
  return holders_.contains(entity);
}

std::size_t EntityLockTable::HeldCount() {
  std::lock_guard lock(mutex_);
  return holders_.size();
}

} // namespace millsync::sync
