#include "payloads.hpp"

#include <algorithm>

namespace millsync::sync {

using millsync::v1::MutationPayload;
using model::EntityRef;
using model::EntityType;

namespace {

void AddUnique(std::vector<EntityRef>& refs, EntityRef ref) {
  if (ref.local_id <= 0) return;
  if (std::find(refs.begin(), refs.end(), ref) == refs.end()) refs.push_back(ref);
}

} // namespace

std::vector<EntityRef> DependenciesOf(const MutationPayload& payload) {
  std::vector<EntityRef> deps;

  switch (payload.body_case()) {
    case MutationPayload::kTransaction: {
      const auto& txn = payload.transaction();
      AddUnique(deps, {EntityType::kCustomer, txn.customer_local_id()});
      for (const auto& item : txn.items()) {
        AddUnique(deps, {EntityType::kInventory, item.inventory_local_id()});
      }
      break;
    }
    case MutationPayload::kPayment:
      AddUnique(deps, {EntityType::kTransaction, payload.payment().transaction_local_id()});
      break;
    case MutationPayload::kMilling:
      AddUnique(deps, {EntityType::kInventory, payload.milling().paddy_item_local_id()});
      AddUnique(deps, {EntityType::kInventory, payload.milling().rice_item_local_id()});
      break;
    default:
      break;
  }
  return deps;
}

MutationPayload SnapshotOf(const db::model::EntityRecord& meta) {
  MutationPayload payload;

  if (meta.is_deleted) {
    auto* tombstone = payload.mutable_tombstone();
    tombstone->set_local_id(meta.local_id);
    tombstone->set_server_id(meta.server_id.value_or(""));
    return payload;
  }

  switch (meta.type) {
    case EntityType::kCustomer:
      *payload.mutable_customer() = ledger::EntityLedger::Decode<millsync::v1::Customer>(meta).body;
      break;
    case EntityType::kInventory:
      *payload.mutable_inventory() = ledger::EntityLedger::Decode<millsync::v1::InventoryItem>(meta).body;
      break;
    case EntityType::kTransaction:
      *payload.mutable_transaction() = ledger::EntityLedger::Decode<millsync::v1::Transaction>(meta).body;
      break;
    case EntityType::kPayment:
      *payload.mutable_payment() = ledger::EntityLedger::Decode<millsync::v1::Payment>(meta).body;
      break;
    case EntityType::kMilling:
      *payload.mutable_milling() = ledger::EntityLedger::Decode<millsync::v1::MillingRecord>(meta).body;
      break;
    case EntityType::kUser:
      *payload.mutable_user() = ledger::EntityLedger::Decode<millsync::v1::User>(meta).body;
      break;
    case EntityType::kUnspecified:
      throw util::ValidationError("cannot snapshot an entity of unspecified type");
  }
  return payload;
}

bool IsSnapshot(const MutationPayload& payload) {
  switch (payload.body_case()) {
    case MutationPayload::kMovement:
    case MutationPayload::kTombstone:
    case MutationPayload::BODY_NOT_SET:
      return false;
    default:
      return true;
  }
}

Resolution ResolveOutbound(db::Transaction& tx, ledger::EntityLedger& ledger, db::model::MutationRecord& record) {
  Resolution out;

  if (record.operation != model::MutationOperation::kCreate && !record.entity_server_id) {
    const auto meta = ledger.Raw(tx, record.Entity());
    if (!meta) {
      out.kind   = Resolution::Kind::kOrphaned;
      out.reason = model::ToString(record.Entity()) + " no longer exists";
      return out;
    }
    if (!meta->server_id || meta->server_id->empty()) {
      out.kind   = Resolution::Kind::kDeferred;
      out.reason = "waiting for server id of " + model::ToString(record.Entity());
      return out;
    }
    record.entity_server_id = meta->server_id;
  }

  for (const auto& parent : record.depends_on) {
    const auto meta = ledger.Raw(tx, parent);
    if (!meta) {
      out.kind   = Resolution::Kind::kOrphaned;
      out.reason = "parent " + model::ToString(parent) + " no longer exists";
      return out;
    }
    if (!meta->server_id || meta->server_id->empty()) {
      out.kind   = Resolution::Kind::kDeferred;
      out.reason = "waiting for server id of " + model::ToString(parent);
      return out;
    }
  }

  auto server_of = [&](EntityType type, int64_t local_id) -> std::string {
    if (local_id <= 0) return {};
    return ledger.ServerIdOf(tx, {type, local_id}).value_or("");
  };

  const std::string own = record.entity_server_id.value_or("");
  out.payload           = record.payload;

  switch (out.payload.body_case()) {
    case MutationPayload::kCustomer:
      out.payload.mutable_customer()->set_server_id(own);
      break;
    case MutationPayload::kInventory:
      out.payload.mutable_inventory()->set_server_id(own);
      break;
    case MutationPayload::kUser:
      out.payload.mutable_user()->set_server_id(own);
      break;
    case MutationPayload::kTransaction: {
      auto* txn = out.payload.mutable_transaction();
      txn->set_server_id(own);
      txn->set_customer_server_id(server_of(EntityType::kCustomer, txn->customer_local_id()));
      for (auto& item : *txn->mutable_items()) {
        item.set_inventory_server_id(server_of(EntityType::kInventory, item.inventory_local_id()));
      }
      break;
    }
    case MutationPayload::kPayment: {
      auto* payment = out.payload.mutable_payment();
      payment->set_server_id(own);
      payment->set_transaction_server_id(server_of(EntityType::kTransaction, payment->transaction_local_id()));
      break;
    }
    case MutationPayload::kMilling: {
      auto* milling = out.payload.mutable_milling();
      milling->set_server_id(own);
      milling->set_paddy_item_server_id(server_of(EntityType::kInventory, milling->paddy_item_local_id()));
      milling->set_rice_item_server_id(server_of(EntityType::kInventory, milling->rice_item_local_id()));
      break;
    }
    case MutationPayload::kMovement:
      out.payload.mutable_movement()->set_item_server_id(own);
      break;
    case MutationPayload::kTombstone:
      out.payload.mutable_tombstone()->set_server_id(own);
      break;
    case MutationPayload::BODY_NOT_SET:
      break;
  }
  return out;
}

} // namespace millsync::sync
