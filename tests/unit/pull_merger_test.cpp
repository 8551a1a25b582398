#include "internal/sync/pull_merger.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/remote/json_codec.hpp"
#include "support/fakes.hpp"

namespace {

using millsync::model::EntityType;
using millsync::remote::HttpMethod;
using millsync::testing::Device;
using millsync::testing::Expect;

constexpr uint64_t kBase = 1'700'000'000'000ULL;

millsync::v1::Customer RemoteCustomer(const std::string& server_id, const std::string& name, uint64_t updated_at_ms) {
  millsync::v1::Customer customer;
  customer.set_server_id(server_id);
  customer.set_name(name);
  customer.set_phone("07" + server_id);
  customer.set_updated_at_ms(updated_at_ms);
  return customer;
}

std::string CustomerFeed(std::initializer_list<millsync::v1::Customer> customers) {
  millsync::v1::CustomerList list;
  for (const auto& customer : customers) *list.add_customers() = customer;
  return millsync::remote::ToJson(list);
}

millsync::sync::PullMergeResult Merge(Device& d, EntityType type, const std::string& json) {
  auto tx     = d.app.repository->Begin();
  auto result = d.app.puller->Merge(*tx, type, json);
  tx->Commit();
  return result;
}

std::optional<uint64_t> Cursor(Device& d, EntityType type) {
  auto tx = d.app.repository->Begin();
  return d.app.puller->Cursor(*tx, type);
}

// Creates a customer locally and syncs it; returns its local id.
int64_t SyncedCustomer(Device& d, const std::string& name) {
  millsync::service::CustomerInput input;
  input.name  = name;
  input.phone = "0771234567";
  const auto customer = Expect(d.service().CreateCustomer(input));
  d.app.orchestrator->RunSyncPass();
  assert(d.Entity(EntityType::kCustomer, customer.local_id()).IsSynced());
  return customer.local_id();
}

void TestAdoptsUnknownRows() {
  Device d;
  assert(!Cursor(d, EntityType::kCustomer));

  const auto result = Merge(d, EntityType::kCustomer, CustomerFeed({RemoteCustomer("srv-a", "Ruwan", kBase + 10), RemoteCustomer("srv-b", "Saman", kBase + 20)}));
  assert(result.received == 2);
  assert(result.applied == 2);
  assert(*result.cursor_ms == kBase + 20);
  assert(*Cursor(d, EntityType::kCustomer) == kBase + 20);

  const auto customers = Expect(d.service().ListCustomers());
  assert(customers.size() == 2);
  for (const auto& customer : customers) {
    const auto meta = d.Entity(EntityType::kCustomer, customer.local_id());
    assert(meta.IsSynced());
    assert(meta.server_id && !meta.server_id->empty());
  }

  // pulled rows are never pushed back
  assert(d.Records().empty());

  // a second delivery of the same rows changes nothing
  const auto again = Merge(d, EntityType::kCustomer, CustomerFeed({RemoteCustomer("srv-a", "Ruwan", kBase + 10)}));
  assert(again.applied == 0);
  assert(Expect(d.service().ListCustomers()).size() == 2);
}

void TestNewerRemoteWinsWhenNothingIsPending() {
  Device     d;
  const auto local_id  = SyncedCustomer(d, "Sunil");
  const auto server_id = *d.Entity(EntityType::kCustomer, local_id).server_id;
  const auto local_at  = d.Entity(EntityType::kCustomer, local_id).updated_at_ms;

  assert(Merge(d, EntityType::kCustomer, CustomerFeed({RemoteCustomer(server_id, "Sunil (old)", local_at - 1)})).applied == 0);
  assert(Expect(d.service().GetCustomer(local_id)).name() == "Sunil");

  assert(Merge(d, EntityType::kCustomer, CustomerFeed({RemoteCustomer(server_id, "Sunil Perera", local_at + 5000)})).applied == 1);
  const auto merged = Expect(d.service().GetCustomer(local_id));
  assert(merged.name() == "Sunil Perera");
  assert(merged.local_id() == local_id);
  assert(d.Entity(EntityType::kCustomer, local_id).updated_at_ms == local_at + 5000);
  assert(d.Entity(EntityType::kCustomer, local_id).IsSynced());
}

void TestPendingLocalChangeWins() {
  Device     d;
  const auto local_id  = SyncedCustomer(d, "Sunil");
  const auto server_id = *d.Entity(EntityType::kCustomer, local_id).server_id;

  millsync::service::CustomerInput edit;
  edit.name  = "Sunil (local)";
  edit.phone = "0771234567";
  Expect(d.service().UpdateCustomer(local_id, edit));

  const auto far_future = d.clock->NowMillis() + 3'600'000;
  assert(Merge(d, EntityType::kCustomer, CustomerFeed({RemoteCustomer(server_id, "Sunil (server)", far_future)})).applied == 0);
  assert(Expect(d.service().GetCustomer(local_id)).name() == "Sunil (local)");

  // the next pass pushes the local copy
  d.app.orchestrator->RunSyncPass();
  assert(d.remote->CountCalls(HttpMethod::kPut, "/customers/" + server_id) == 1);
}

void TestSkipsEntriesWithoutServerId() {
  Device d;
  const auto result = Merge(d, EntityType::kCustomer, CustomerFeed({RemoteCustomer("", "Nobody", kBase + 50), RemoteCustomer("srv-c", "Chaminda", kBase + 40)}));
  assert(result.received == 2);
  assert(result.applied == 1);
  assert(*Cursor(d, EntityType::kCustomer) == kBase + 50);
}

void TestLinksTransactionReferences() {
  Device d;
  Merge(d, EntityType::kCustomer, CustomerFeed({RemoteCustomer("srv-c1", "Ruwan", kBase)}));

  millsync::v1::InventoryList stock;
  auto*                       item = stock.add_inventory();
  item->set_server_id("srv-i1");
  item->set_type(millsync::v1::ITEM_TYPE_PADDY);
  item->set_variety("Keeri Samba");
  item->set_current_quantity(750);
  item->set_updated_at_ms(kBase);
  Merge(d, EntityType::kInventory, millsync::remote::ToJson(stock));

  millsync::v1::TransactionList trades;
  auto*                         txn = trades.add_transactions();
  txn->set_server_id("srv-t1");
  txn->set_type(millsync::v1::TRANSACTION_TYPE_BUY);
  txn->set_transaction_number("BUY-20231114-0042");
  txn->set_customer_server_id("srv-c1");
  txn->set_updated_at_ms(kBase + 1);
  auto* line = txn->add_items();
  line->set_inventory_server_id("srv-i1");
  line->set_quantity(250);
  Merge(d, EntityType::kTransaction, millsync::remote::ToJson(trades));

  const auto customers = Expect(d.service().ListCustomers());
  const auto items     = Expect(d.service().ListInventory());
  assert(customers.size() == 1 && items.size() == 1);
  assert(items[0].current_quantity() == 750);

  int64_t txn_local_id = 0;
  {
    auto tx  = d.app.repository->Begin();
    auto hit = d.app.ledger->FindByServerId<millsync::v1::Transaction>(*tx, "srv-t1");
    assert(hit);
    txn_local_id = hit->LocalId();
  }
  const auto pulled = Expect(d.service().GetTransaction(txn_local_id));
  assert(pulled.customer_local_id() == customers[0].local_id());
  assert(pulled.items(0).inventory_local_id() == items[0].local_id());
}

void TestRejectsMalformedFeed() {
  Device d;
  bool   threw = false;
  try {
    Merge(d, EntityType::kCustomer, "{\"customers\": [");
  } catch (const millsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(!Cursor(d, EntityType::kCustomer));
}

void TestPassPullsWithCursor() {
  Device d;
  d.remote->SetUpdates(EntityType::kCustomer, CustomerFeed({RemoteCustomer("srv-z", "Zahir", kBase + 99)}));

  auto pass = d.app.orchestrator->RunSyncPass();
  assert(pass.pulled == 1);
  assert(d.remote->CountCalls(HttpMethod::kGet, "/customers/updates?since=0") == 1);
  assert(d.remote->CountCalls(HttpMethod::kGet, "/inventory/updates?since=0") == 1);
  assert(d.remote->CountCalls(HttpMethod::kGet, "/transactions/updates?since=0") == 1);

  pass = d.app.orchestrator->RunSyncPass();
  assert(pass.pulled == 0);
  assert(d.remote->CountCalls(HttpMethod::kGet, "/customers/updates?since=" + std::to_string(kBase + 99)) == 1);

  d.remote->SetUpdates(EntityType::kInventory, "not json");
  pass = d.app.orchestrator->RunSyncPass();
  assert(!pass.errors.empty());
  assert(d.app.status->Snapshot().state == millsync::sync::SyncState::kError);
}

} // namespace

int main() {
  TestAdoptsUnknownRows();
  TestNewerRemoteWinsWhenNothingIsPending();
  TestPendingLocalChangeWins();
  TestSkipsEntriesWithoutServerId();
  TestLinksTransactionReferences();
  TestRejectsMalformedFeed();
  TestPassPullsWithCursor();

  std::cout << "millsync_unit_pull_merger: pass\n";
  return 0;
}
