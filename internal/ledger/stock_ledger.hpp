#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/ledger/entity_ledger.hpp"

namespace millsync::ledger {

struct MovementRequest {
  int64_t                    item_local_id = 0;
  millsync::v1::MovementKind kind          = millsync::v1::MOVEMENT_KIND_UNSPECIFIED;

  double  quantity_delta = 0;
  int32_t bags_delta     = 0;
  // only stock-increasing movements with a price move the average
  double unit_price = 0;

  std::string reference;
  std::string note;
};

struct AppliedMovement {
  Entity<millsync::v1::InventoryItem> item;
  db::model::StockMovementRecord      record;

  millsync::v1::StockMovement ToProto() const;
};

/*
  Inventory stock bookkeeping.

  current_quantity/current_bags always equal the sum of the item's movement
  history (opening entry included). A movement that would take either below
  zero throws util::ValidationError and writes nothing.
*/
class StockLedger {
 public:
  StockLedger(std::shared_ptr<EntityLedger> entities, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock);

  AppliedMovement Apply(db::Transaction& tx, const MovementRequest& request);

  // History entry for the stock an item was created with.
  void RecordOpening(db::Transaction& tx, const Entity<millsync::v1::InventoryItem>& item, double unit_price);

  // required: item local id -> kg needed. Throws util::ValidationError naming the first short item.
  void EnsureAvailable(db::Transaction& tx, const std::map<int64_t, double>& required);

  std::vector<db::model::StockMovementRecord> History(db::Transaction& tx, int64_t item_local_id);

  static double WeightedAverage(double old_quantity, double old_average, double added_quantity, double added_price);

 private:
  std::shared_ptr<EntityLedger>   entities_;
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
};

} // namespace millsync::ledger
