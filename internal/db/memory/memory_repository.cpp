#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace millsync::db::memory {

using millsync::model::EntityRef;
using millsync::model::EntityType;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

int64_t MemoryRepository::NextSequence(Transaction& t, const std::string& name) {
  return ++TX(t).Mutable().sequences[name];
}

// ------------------------------------------------------------------
// Entity ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.entities.contains(r.Ref())) return Result::Err(ErrorCode::AlreadyExists, millsync::model::ToString(r.Ref()));
  s.entities[r.Ref()] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateEntity(Transaction& t, const model::EntityRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entities.find(r.Ref());
  if (it == s.entities.end()) return Result::Err(ErrorCode::NotFound, millsync::model::ToString(r.Ref()));
  it->second = r;
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, EntityType type, int64_t local_id) {
  const auto& s  = TX(t).View();
  auto        it = s.entities.find(EntityRef{type, local_id});
  if (it == s.entities.end()) return std::nullopt;
  return it->second;
}

std::optional<model::EntityRecord> MemoryRepository::FindEntityByServerId(Transaction& t, EntityType type, const std::string& server_id) {
  for (const auto& [ref, record] : TX(t).View().entities) {
    if (ref.type == type && record.server_id == server_id) return record;
  }
  return std::nullopt;
}

std::optional<model::EntityRecord> MemoryRepository::FindEntityByNaturalKey(Transaction& t, EntityType type, const std::string& natural_key) {
  for (const auto& [ref, record] : TX(t).View().entities) {
    if (ref.type == type && !record.is_deleted && record.natural_key == natural_key) return record;
  }
  return std::nullopt;
}

std::vector<model::EntityRecord> MemoryRepository::ListEntities(Transaction& t, EntityType type, const EntityFilter& filter) {
  std::vector<model::EntityRecord> records;
  for (const auto& [ref, record] : TX(t).View().entities) {
    if (ref.type != type) continue;
    if (filter.unsynced_only && record.IsSynced()) continue;
    if (!filter.include_deleted && record.is_deleted) continue;
    if (filter.updated_after_ms && record.updated_at_ms <= *filter.updated_after_ms) continue;
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteEntity(Transaction& t, EntityType type, int64_t local_id) {
  TX(t).Mutable().entities.erase(EntityRef{type, local_id});
  return Result::Ok();
}

// ------------------------------------------------------------------
// Stock history
// ------------------------------------------------------------------

Result MemoryRepository::AppendStockMovement(Transaction& t, model::StockMovementRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_movement_id++;
  s.movements.push_back(r);
  return Result::Ok();
}

std::vector<model::StockMovementRecord> MemoryRepository::ListStockMovements(Transaction& t, int64_t item_local_id) {
  std::vector<model::StockMovementRecord> out;
  for (const auto& movement : TX(t).View().movements) {
    if (movement.item_local_id == item_local_id) out.push_back(movement);
  }
  return out;
}

// ------------------------------------------------------------------
// Mutation queue
// ------------------------------------------------------------------

Result MemoryRepository::InsertMutation(Transaction& t, const model::MutationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.mutations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  for (const auto& [_, existing] : s.mutations) {
    if (existing.sequence == r.sequence) return Result::Err(ErrorCode::ConstraintViolation, "duplicate mutation sequence");
  }
  s.mutations[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateMutation(Transaction& t, const model::MutationRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.mutations.find(r.id);
  if (it == s.mutations.end()) return Result::Err(ErrorCode::NotFound, r.id);
  it->second = r;
  return Result::Ok();
}

std::optional<model::MutationRecord> MemoryRepository::GetMutation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.mutations.find(id);
  if (it == s.mutations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MutationRecord> MemoryRepository::ListMutations(Transaction& t, const MutationFilter& filter) {
  std::vector<model::MutationRecord> out;
  for (const auto& [_, record] : TX(t).View().mutations) {
    if (filter.status && record.status != *filter.status) continue;
    if (filter.entity && record.Entity() != *filter.entity) continue;
    out.push_back(record);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });

  if (filter.limit && out.size() > *filter.limit) {
    out.resize(*filter.limit);
  }
  return out;
}

Result MemoryRepository::DeleteMutation(Transaction& t, const std::string& id) {
  TX(t).Mutable().mutations.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Pull cursors
// ------------------------------------------------------------------

std::optional<uint64_t> MemoryRepository::GetSyncCursor(Transaction& t, const std::string& scope) {
  const auto& s  = TX(t).View();
  auto        it = s.cursors.find(scope);
  if (it == s.cursors.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetSyncCursor(Transaction& t, const std::string& scope, uint64_t value_ms) {
  TX(t).Mutable().cursors[scope] = value_ms;
  return Result::Ok();
}

} // namespace millsync::db::memory
