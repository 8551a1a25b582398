#include "stock_ledger.hpp"

#include <cmath>
#include <sstream>

#include "internal/observability/logging.hpp"

namespace millsync::ledger {

namespace {

// kg values come from user input; anything closer than this is equal
constexpr double kQuantityEpsilon = 1e-6;

std::string Describe(const millsync::v1::InventoryItem& item) {
  return item.variety().empty() ? millsync::v1::ItemType_Name(item.type()) : item.variety();
}

std::string FormatKg(double kg) {
  std::ostringstream out;
  out << kg << " kg";
  return out.str();
}

} // namespace

millsync::v1::StockMovement AppliedMovement::ToProto() const {
  millsync::v1::StockMovement movement;
  movement.set_item_local_id(record.item_local_id);
  movement.set_item_server_id(item.meta.server_id.value_or(""));
  movement.set_kind(record.kind);
  movement.set_quantity_delta(record.quantity_delta);
  movement.set_bags_delta(record.bags_delta);
  movement.set_unit_price(record.unit_price);
  movement.set_reference(record.reference);
  movement.set_note(record.note);
  movement.set_recorded_at_ms(record.recorded_at_ms);
  return movement;
}

StockLedger::StockLedger(std::shared_ptr<EntityLedger> entities, std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock)
    : entities_(std::move(entities)), repository_(std::move(repository)), clock_(std::move(clock)) {
}

double StockLedger::WeightedAverage(double old_quantity, double old_average, double added_quantity, double added_price) {
  const double total = old_quantity + added_quantity;
  if (old_quantity <= kQuantityEpsilon || total <= kQuantityEpsilon) {
    return added_price;
  }
  return (old_quantity * old_average + added_quantity * added_price) / total;
}

AppliedMovement StockLedger::Apply(db::Transaction& tx, const MovementRequest& request) {
  if (!std::isfinite(request.quantity_delta) || !std::isfinite(request.unit_price) || request.unit_price < 0) {
    throw util::ValidationError("invalid stock movement values");
  }

  auto item = entities_->Get<millsync::v1::InventoryItem>(tx, request.item_local_id);

  const double old_quantity = item.body.current_quantity();
  double       new_quantity = old_quantity + request.quantity_delta;
  if (new_quantity < -kQuantityEpsilon) {
    throw util::ValidationError("Insufficient stock for " + Describe(item.body) + ": available " + FormatKg(old_quantity) + ", requested " +
                                FormatKg(-request.quantity_delta));
  }
  if (new_quantity < 0) new_quantity = 0;

  const int32_t new_bags = item.body.current_bags() + request.bags_delta;
  if (new_bags < 0) {
    throw util::ValidationError("Insufficient bags for " + Describe(item.body) + ": available " + std::to_string(item.body.current_bags()) +
                                ", requested " + std::to_string(-request.bags_delta));
  }

  if (request.quantity_delta > 0 && request.unit_price > 0) {
    item.body.set_average_price_per_kg(
        WeightedAverage(old_quantity, item.body.average_price_per_kg(), request.quantity_delta, request.unit_price));
  }
  item.body.set_current_quantity(new_quantity);
  item.body.set_current_bags(new_bags);
  entities_->Save(tx, item);

  db::model::StockMovementRecord record;
  record.item_local_id  = item.LocalId();
  record.kind           = request.kind;
  record.quantity_delta = request.quantity_delta;
  record.bags_delta     = request.bags_delta;
  record.unit_price     = request.unit_price;
  record.reference      = request.reference;
  record.note           = request.note;
  record.recorded_at_ms = clock_->NowMillis();
  db::ThrowIfDbError(repository_->AppendStockMovement(tx, record), "append stock movement");

  MILLSYNC_LOG_DEBUG("Stock movement applied", {observability::IntField("item", item.LocalId()),
                                                observability::StringField("kind", millsync::v1::MovementKind_Name(request.kind)),
                                                observability::DoubleField("delta_kg", request.quantity_delta),
                                                observability::DoubleField("quantity_kg", new_quantity)});

  return AppliedMovement{std::move(item), std::move(record)};
}

void StockLedger::RecordOpening(db::Transaction& tx, const Entity<millsync::v1::InventoryItem>& item, double unit_price) {
  db::model::StockMovementRecord record;
  record.item_local_id  = item.LocalId();
  record.kind           = millsync::v1::MOVEMENT_KIND_OPENING;
  record.quantity_delta = item.body.current_quantity();
  record.bags_delta     = item.body.current_bags();
  record.unit_price     = unit_price;
  record.note           = "opening stock";
  record.recorded_at_ms = clock_->NowMillis();
  db::ThrowIfDbError(repository_->AppendStockMovement(tx, record), "append opening stock");
}

void StockLedger::EnsureAvailable(db::Transaction& tx, const std::map<int64_t, double>& required) {
  for (const auto& [item_id, quantity] : required) {
    auto item = entities_->Get<millsync::v1::InventoryItem>(tx, item_id);
    if (item.body.current_quantity() + kQuantityEpsilon < quantity) {
      throw util::ValidationError("Insufficient stock for " + Describe(item.body) + ": available " + FormatKg(item.body.current_quantity()) +
                                  ", requested " + FormatKg(quantity));
    }
  }
}

std::vector<db::model::StockMovementRecord> StockLedger::History(db::Transaction& tx, int64_t item_local_id) {
  return repository_->ListStockMovements(tx, item_local_id);
}

} // namespace millsync::ledger
