#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace millsync::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace millsync::db::sqlite
