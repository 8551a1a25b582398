#include "pull_merger.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/remote/json_codec.hpp"
#include "millsync/v1/remote.pb.h"

namespace millsync::sync {

using model::EntityType;

PullMerger::PullMerger(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::EntityLedger> ledger, std::shared_ptr<SyncQueue> queue)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), queue_(std::move(queue)) {
}

bool PullMerger::SupportsPull(EntityType type) {
  return type == EntityType::kCustomer || type == EntityType::kInventory || type == EntityType::kTransaction;
}

std::string PullMerger::CursorScope(EntityType type) {
  return "pull:" + std::string(model::EntityTypeName(type));
}

std::optional<uint64_t> PullMerger::Cursor(db::Transaction& tx, EntityType type) {
  return repository_->GetSyncCursor(tx, CursorScope(type));
}

PullMergeResult PullMerger::Merge(db::Transaction& tx, EntityType type, const std::string& json) {
  PullMergeResult result;
  uint64_t        newest = Cursor(tx, type).value_or(0);

  auto merge_all = [&](auto& entries) {
    result.received = static_cast<std::size_t>(entries.size());
    for (auto& entry : entries) {
      newest = std::max<uint64_t>(newest, entry.updated_at_ms());
      if (MergeOne(tx, entry)) ++result.applied;
    }
  };

  switch (type) {
    case EntityType::kCustomer: {
      millsync::v1::CustomerList list;
      remote::FromJson(json, &list);
      merge_all(*list.mutable_customers());
      break;
    }
    case EntityType::kInventory: {
      millsync::v1::InventoryList list;
      remote::FromJson(json, &list);
      merge_all(*list.mutable_inventory());
      break;
    }
    case EntityType::kTransaction: {
      millsync::v1::TransactionList list;
      remote::FromJson(json, &list);
      merge_all(*list.mutable_transactions());
      break;
    }
    default:
      throw util::ValidationError(std::string(model::EntityTypeName(type)) + " has no updates feed");
  }

  if (result.received > 0) {
    db::ThrowIfDbError(repository_->SetSyncCursor(tx, CursorScope(type), newest), "set pull cursor");
    result.cursor_ms = newest;
  }
  return result;
}

template <typename Body>
bool PullMerger::MergeOne(db::Transaction& tx, Body remote) {
  const std::string server_id = remote.server_id();
  if (server_id.empty()) {
    MILLSYNC_LOG_WARN("Pulled entry without server id ignored", {observability::StringField("type", model::EntityTypeName(ledger::EntityTraits<Body>::kType))});
    return false;
  }

  LinkReferences(tx, remote);

  auto local = ledger_->FindByServerId<Body>(tx, server_id);
  if (!local) {
    db::model::EntityRecord meta;
    meta.type          = ledger::EntityTraits<Body>::kType;
    meta.server_id     = server_id;
    meta.created_at_ms = remote.updated_at_ms();
    meta.updated_at_ms = remote.updated_at_ms();
    ledger::EntityLedger::Encode(meta, remote);
    ledger_->Adopt(tx, meta);
    return true;
  }

  if (local->meta.is_deleted || !local->meta.IsSynced() || !queue_->OutstandingFor(tx, local->Ref()).empty()) {
    return false;
  }
  if (remote.updated_at_ms() <= local->meta.updated_at_ms) {
    return false;
  }

  remote.set_local_id(local->LocalId());
  local->meta.updated_at_ms = remote.updated_at_ms();
  ledger::EntityLedger::Encode(local->meta, remote);
  ledger_->Store(tx, local->meta);

  MILLSYNC_LOG_DEBUG("Remote change applied", {observability::StringField("entity", model::ToString(local->Ref())),
                                              observability::StringField("server_id", server_id)});
  return true;
}

void PullMerger::ApplyServerCopy(db::Transaction& tx, model::EntityRef entity, const std::string& json) {
  switch (entity.type) {
    case EntityType::kCustomer: {
      millsync::v1::Customer body;
      remote::FromJson(json, &body);
      Overwrite(tx, entity.local_id, std::move(body));
      break;
    }
    case EntityType::kInventory: {
      millsync::v1::InventoryItem body;
      remote::FromJson(json, &body);
      Overwrite(tx, entity.local_id, std::move(body));
      break;
    }
    case EntityType::kTransaction: {
      millsync::v1::Transaction body;
      remote::FromJson(json, &body);
      Overwrite(tx, entity.local_id, std::move(body));
      break;
    }
    default:
      throw util::ValidationError(std::string(model::EntityTypeName(entity.type)) + " cannot be fetched from the server");
  }
}

namespace {

template <typename Body>
void KeepLocalStock(const Body&, Body&) {
}

// stock only moves through movements
void KeepLocalStock(const millsync::v1::InventoryItem& local, millsync::v1::InventoryItem& remote) {
  remote.set_current_quantity(local.current_quantity());
  remote.set_current_bags(local.current_bags());
  remote.set_average_price_per_kg(local.average_price_per_kg());
  remote.set_opening_quantity(local.opening_quantity());
  remote.set_opening_bags(local.opening_bags());
}

} // namespace

template <typename Body>
void PullMerger::Overwrite(db::Transaction& tx, int64_t local_id, Body remote) {
  auto local = ledger_->Find<Body>(tx, local_id);
  if (!local || !local->meta.server_id || local->meta.server_id->empty()) {
    throw util::NotFound(model::ToString({ledger::EntityTraits<Body>::kType, local_id}) + " has no server copy");
  }
  if (!remote.server_id().empty() && remote.server_id() != *local->meta.server_id) {
    throw util::ValidationError("server returned " + remote.server_id() + " for " + *local->meta.server_id);
  }

  LinkReferences(tx, remote);
  KeepLocalStock(local->body, remote);
  remote.set_local_id(local_id);
  remote.set_server_id(*local->meta.server_id);

  local->meta.is_deleted = false;
  if (remote.updated_at_ms() > local->meta.updated_at_ms) {
    local->meta.updated_at_ms = remote.updated_at_ms();
  }
  ledger::EntityLedger::Encode(local->meta, remote);
  ledger_->Store(tx, local->meta);

  MILLSYNC_LOG_INFO("Server copy applied", {observability::StringField("entity", model::ToString(local->Ref())),
                                           observability::StringField("server_id", *local->meta.server_id)});
}

void PullMerger::LinkReferences(db::Transaction& tx, millsync::v1::Transaction& txn) {
  if (!txn.customer_server_id().empty()) {
    txn.set_customer_local_id(LocalIdOf(tx, EntityType::kCustomer, txn.customer_server_id()).value_or(0));
  }
  for (auto& item : *txn.mutable_items()) {
    if (!item.inventory_server_id().empty()) {
      item.set_inventory_local_id(LocalIdOf(tx, EntityType::kInventory, item.inventory_server_id()).value_or(0));
    }
  }
}

std::optional<int64_t> PullMerger::LocalIdOf(db::Transaction& tx, EntityType type, const std::string& server_id) {
  auto meta = repository_->FindEntityByServerId(tx, type, server_id);
  if (!meta) return std::nullopt;
  return meta->local_id;
}

} // namespace millsync::sync
