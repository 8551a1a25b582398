#include "internal/remote/endpoints.hpp"

#include <cassert>
#include <iostream>

#include "internal/remote/json_codec.hpp"
#include "internal/util/errors.hpp"
#include "millsync/v1.hpp"

namespace {

using millsync::db::model::MutationRecord;
using millsync::model::EntityType;
using millsync::model::MutationOperation;
using millsync::v1::MutationPayload;
using namespace millsync::remote;

MutationRecord MakeRecord(EntityType type, MutationOperation op, std::optional<std::string> server_id = std::nullopt) {
  MutationRecord record;
  record.id               = "mut-1";
  record.entity_type      = type;
  record.entity_id        = 7;
  record.operation        = op;
  record.entity_server_id = std::move(server_id);
  return record;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestPaths() {
  assert(CollectionPath(EntityType::kCustomer) == "/customers");
  assert(CollectionPath(EntityType::kInventory) == "/inventory");
  assert(CollectionPath(EntityType::kTransaction) == "/transactions");
  assert(BatchPath(EntityType::kInventory) == "/inventory/batch");
  assert(!SupportsBatch(EntityType::kPayment));
  assert(Throws<millsync::util::ValidationError>([] { BatchPath(EntityType::kMilling); }));

  assert(UpdatesPath(EntityType::kCustomer, std::nullopt) == "/customers/updates?since=0");
  assert(UpdatesPath(EntityType::kTransaction, 1234) == "/transactions/updates?since=1234");
}

void TestSnapshotRequests() {
  MutationPayload payload;
  payload.mutable_customer()->set_local_id(7);
  payload.mutable_customer()->set_name("Sunil Perera");

  auto create = BuildPushRequest(MakeRecord(EntityType::kCustomer, MutationOperation::kCreate), payload);
  assert(create.method == HttpMethod::kPost);
  assert(create.path == "/customers");

  millsync::v1::Customer echoed;
  FromJson(create.body, &echoed);
  assert(echoed.name() == "Sunil Perera");
  assert(create.body.find("\"local_id\"") != std::string::npos);

  auto update = BuildPushRequest(MakeRecord(EntityType::kCustomer, MutationOperation::kUpdate, "c-42"), payload);
  assert(update.method == HttpMethod::kPut);
  assert(update.path == "/customers/c-42");

  assert(Throws<millsync::util::InvalidState>([&] { BuildPushRequest(MakeRecord(EntityType::kCustomer, MutationOperation::kUpdate), payload); }));

  MutationPayload milling;
  milling.mutable_milling()->set_paddy_quantity(1000);
  assert(BuildPushRequest(MakeRecord(EntityType::kMilling, MutationOperation::kCreate), milling).path == "/milling/create");
}

void TestPaymentRequest() {
  MutationPayload payload;
  payload.mutable_payment()->set_amount(2500);

  auto record = MakeRecord(EntityType::kPayment, MutationOperation::kCreate);
  assert(Throws<millsync::util::InvalidState>([&] { BuildPushRequest(record, payload); }));

  payload.mutable_payment()->set_transaction_server_id("t-9");
  auto request = BuildPushRequest(record, payload);
  assert(request.method == HttpMethod::kPost);
  assert(request.path == "/transactions/t-9/payments");

  record.operation = MutationOperation::kUpdate;
  assert(Throws<millsync::util::ValidationError>([&] { BuildPushRequest(record, payload); }));
}

void TestMovementRequests() {
  auto record = MakeRecord(EntityType::kInventory, MutationOperation::kUpdate, "i-1");

  MutationPayload in;
  in.mutable_movement()->set_kind(millsync::v1::MOVEMENT_KIND_STOCK_IN);
  in.mutable_movement()->set_quantity_delta(500);
  assert(BuildPushRequest(record, in).path == "/inventory/add-stock");

  MutationPayload out;
  out.mutable_movement()->set_kind(millsync::v1::MOVEMENT_KIND_STOCK_OUT);
  out.mutable_movement()->set_quantity_delta(-200);
  assert(BuildPushRequest(record, out).path == "/inventory/deduct-stock");

  MutationPayload adjust;
  adjust.mutable_movement()->set_kind(millsync::v1::MOVEMENT_KIND_ADJUSTMENT);
  adjust.mutable_movement()->set_quantity_delta(-3);
  assert(BuildPushRequest(record, adjust).path == "/inventory/adjust");
}

void TestDeleteRequest() {
  MutationPayload payload;
  payload.mutable_tombstone()->set_local_id(7);

  auto request = BuildPushRequest(MakeRecord(EntityType::kInventory, MutationOperation::kDelete, "i-3"), payload);
  assert(request.method == HttpMethod::kDelete);
  assert(request.path == "/inventory/i-3");
  assert(request.body.empty());

  MutationPayload empty;
  assert(Throws<millsync::util::ValidationError>([&] { BuildPushRequest(MakeRecord(EntityType::kInventory, MutationOperation::kDelete, "i-3"), empty); }));
}

} // namespace

int main() {
  TestPaths();
  TestSnapshotRequests();
  TestPaymentRequest();
  TestMovementRequests();
  TestDeleteRequest();

  std::cout << "millsync_unit_endpoints: pass\n";
  return 0;
}
