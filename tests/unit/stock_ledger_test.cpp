#include "internal/ledger/stock_ledger.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "support/fakes.hpp"

namespace {

using millsync::ledger::EntityLedger;
using millsync::ledger::MovementRequest;
using millsync::ledger::StockLedger;
using millsync::testing::ManualClock;
using millsync::v1::InventoryItem;

struct Fixture {
  std::shared_ptr<millsync::db::Repository> repo    = std::make_shared<millsync::db::memory::MemoryRepository>();
  std::shared_ptr<ManualClock>              clock   = std::make_shared<ManualClock>();
  std::shared_ptr<EntityLedger>             ledger  = std::make_shared<EntityLedger>(repo, clock);
  StockLedger                               stock{ledger, repo, clock};

  int64_t CreateItem(const std::string& variety, double kg, int32_t bags, double price) {
    auto tx = repo->Begin();

    InventoryItem body;
    body.set_type(millsync::v1::ITEM_TYPE_PADDY);
    body.set_variety(variety);
    body.set_current_quantity(kg);
    body.set_current_bags(bags);
    body.set_average_price_per_kg(price);

    auto item = ledger->Create(*tx, std::move(body));
    if (kg > 0) stock.RecordOpening(*tx, item, price);
    tx->Commit();
    return item.LocalId();
  }

  InventoryItem Item(int64_t id) {
    auto tx = repo->Begin();
    return ledger->Get<InventoryItem>(*tx, id).body;
  }

  void Apply(int64_t id, millsync::v1::MovementKind kind, double kg, int32_t bags, double price = 0) {
    MovementRequest request;
    request.item_local_id  = id;
    request.kind           = kind;
    request.quantity_delta = kg;
    request.bags_delta     = bags;
    request.unit_price     = price;
    request.reference      = "REF";

    auto tx = repo->Begin();
    stock.Apply(*tx, request);
    tx->Commit();
  }

  double HistorySum(int64_t id) {
    auto   tx  = repo->Begin();
    double sum = 0;
    for (const auto& movement : stock.History(*tx, id)) sum += movement.quantity_delta;
    return sum;
  }
};

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

template <typename Fn>
bool Rejects(Fn&& fn) {
  try {
    fn();
  } catch (const millsync::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestCurrentQuantityMatchesHistory() {
  Fixture f;
  const auto id = f.CreateItem("Samba", 100, 2, 90);

  f.Apply(id, millsync::v1::MOVEMENT_KIND_STOCK_IN, 500, 10, 100);
  f.Apply(id, millsync::v1::MOVEMENT_KIND_STOCK_OUT, -250.5, -5);
  f.Apply(id, millsync::v1::MOVEMENT_KIND_REVERSAL_IN, 250.5, 5);
  f.Apply(id, millsync::v1::MOVEMENT_KIND_MILLING_OUT, -349.5, -7);

  const auto item = f.Item(id);
  assert(Near(item.current_quantity(), 250.5));
  assert(item.current_bags() == 5);
  assert(Near(item.current_quantity(), f.HistorySum(id)));
}

void TestOverdrawWritesNothing() {
  Fixture f;
  const auto id = f.CreateItem("Nadu", 500, 10, 100);

  assert(Rejects([&] { f.Apply(id, millsync::v1::MOVEMENT_KIND_STOCK_OUT, -600, -1); }));
  assert(Rejects([&] { f.Apply(id, millsync::v1::MOVEMENT_KIND_STOCK_OUT, -10, -11); }));

  const auto item = f.Item(id);
  assert(Near(item.current_quantity(), 500));
  assert(item.current_bags() == 10);
  assert(Near(f.HistorySum(id), 500));
}

void TestWeightedAveragePrice() {
  Fixture f;
  const auto id = f.CreateItem("Keeri Samba", 100, 0, 100);

  f.Apply(id, millsync::v1::MOVEMENT_KIND_STOCK_IN, 300, 0, 120);
  assert(Near(f.Item(id).average_price_per_kg(), 115));

  // outgoing stock leaves the average alone
  f.Apply(id, millsync::v1::MOVEMENT_KIND_STOCK_OUT, -200, 0);
  assert(Near(f.Item(id).average_price_per_kg(), 115));

  assert(Near(StockLedger::WeightedAverage(0, 0, 50, 80), 80));
}

void TestEnsureAvailable() {
  Fixture f;
  const auto a = f.CreateItem("Samba", 500, 0, 100);
  const auto b = f.CreateItem("Nadu", 100, 0, 100);

  auto tx = f.repo->Begin();
  f.stock.EnsureAvailable(*tx, {{a, 500}, {b, 99.5}});

  std::string message;
  try {
    f.stock.EnsureAvailable(*tx, {{a, 600}});
  } catch (const millsync::util::ValidationError& e) {
    message = e.what();
  }
  assert(message.find("Insufficient stock for Samba") != std::string::npos);
  assert(message.find("500 kg") != std::string::npos);
}

void TestRejectsNonFiniteInput() {
  Fixture f;
  const auto id = f.CreateItem("Samba", 10, 0, 100);
  assert(Rejects([&] { f.Apply(id, millsync::v1::MOVEMENT_KIND_STOCK_IN, std::nan(""), 0); }));
  assert(Rejects([&] { f.Apply(id, millsync::v1::MOVEMENT_KIND_STOCK_IN, 10, 0, -1); }));
}

} // namespace

int main() {
  TestCurrentQuantityMatchesHistory();
  TestOverdrawWritesNothing();
  TestWeightedAveragePrice();
  TestEnsureAvailable();
  TestRejectsNonFiniteInput();

  std::cout << "millsync_unit_stock_ledger: pass\n";
  return 0;
}
