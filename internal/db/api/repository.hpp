#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/mutation_record.hpp"
#include "internal/db/model/stock_movement_record.hpp"

namespace millsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A domain write (ledger rows + stock history + queued mutations) is
    visible all at once or not at all

  The local store is the source of truth for:
    entity ledger
    mutation queue
    stock history
    pull cursors
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Monotonic per-name counter (local ids, transaction numbers, queue sequence).
  virtual int64_t NextSequence(Transaction&, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Entity ledger
  // ---------------------------------------------------------------------

  virtual Result InsertEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual Result UpdateEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, millsync::model::EntityType type, int64_t local_id) = 0;

  virtual std::optional<model::EntityRecord> FindEntityByServerId(Transaction&, millsync::model::EntityType type,
                                                                  const std::string& server_id) = 0;

  // First live (non-deleted) entity carrying the key.
  virtual std::optional<model::EntityRecord> FindEntityByNaturalKey(Transaction&, millsync::model::EntityType type,
                                                                    const std::string& natural_key) = 0;

  // Ordered by local id.
  virtual std::vector<model::EntityRecord> ListEntities(Transaction&, millsync::model::EntityType type, const EntityFilter& filter) = 0;

  // Hard delete. Only used once a tombstone's Delete has synced.
  virtual Result DeleteEntity(Transaction&, millsync::model::EntityType type, int64_t local_id) = 0;

  // ---------------------------------------------------------------------
  // Stock history
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result AppendStockMovement(Transaction&, model::StockMovementRecord& record) = 0;

  // Oldest first.
  virtual std::vector<model::StockMovementRecord> ListStockMovements(Transaction&, int64_t item_local_id) = 0;

  // ---------------------------------------------------------------------
  // Mutation queue
  // ---------------------------------------------------------------------

  virtual Result InsertMutation(Transaction&, const model::MutationRecord&) = 0;

  virtual Result UpdateMutation(Transaction&, const model::MutationRecord&) = 0;

  virtual std::optional<model::MutationRecord> GetMutation(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::MutationRecord> ListMutations(Transaction&, const MutationFilter& filter) = 0;

  virtual Result DeleteMutation(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Pull cursors
  // ---------------------------------------------------------------------

  virtual std::optional<uint64_t> GetSyncCursor(Transaction&, const std::string& scope) = 0;

  virtual Result SetSyncCursor(Transaction&, const std::string& scope, uint64_t value_ms) = 0;
};

} // namespace millsync::db
