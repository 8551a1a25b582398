#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace millsync::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  int64_t NextSequence(Transaction&, const std::string& name) override;

  Result                             InsertEntity(Transaction&, const model::EntityRecord&) override;
  Result                             UpdateEntity(Transaction&, const model::EntityRecord&) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, millsync::model::EntityType, int64_t) override;
  std::optional<model::EntityRecord> FindEntityByServerId(Transaction&, millsync::model::EntityType, const std::string&) override;
  std::optional<model::EntityRecord> FindEntityByNaturalKey(Transaction&, millsync::model::EntityType, const std::string&) override;
  std::vector<model::EntityRecord>   ListEntities(Transaction&, millsync::model::EntityType, const EntityFilter&) override;
  Result                             DeleteEntity(Transaction&, millsync::model::EntityType, int64_t) override;

  Result                                  AppendStockMovement(Transaction&, model::StockMovementRecord&) override;
  std::vector<model::StockMovementRecord> ListStockMovements(Transaction&, int64_t item_local_id) override;

  Result                               InsertMutation(Transaction&, const model::MutationRecord&) override;
  Result                               UpdateMutation(Transaction&, const model::MutationRecord&) override;
  std::optional<model::MutationRecord> GetMutation(Transaction&, const std::string&) override;
  std::vector<model::MutationRecord>   ListMutations(Transaction&, const MutationFilter&) override;
  Result                               DeleteMutation(Transaction&, const std::string&) override;

  std::optional<uint64_t> GetSyncCursor(Transaction&, const std::string& scope) override;
  Result                  SetSyncCursor(Transaction&, const std::string& scope, uint64_t value_ms) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<millsync::model::EntityRef, model::EntityRecord> entities;
    std::vector<model::StockMovementRecord>                   movements;
    std::map<std::string, model::MutationRecord>              mutations;
    std::unordered_map<std::string, int64_t>                  sequences;
    std::unordered_map<std::string, uint64_t>                 cursors;
    int64_t                                                   next_movement_id = 1;
  };

  // serializes transactions; held for a transaction's whole lifetime
  std::mutex writer_mutex_;

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace millsync::db::memory
