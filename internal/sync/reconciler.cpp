#include "reconciler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/sync/mutation_lifecycle.hpp"
#include "internal/sync/payloads.hpp"

namespace millsync::sync {

using db::model::MutationRecord;
using model::EntityType;
using model::MutationOperation;
using model::MutationStatus;

namespace {

// Higher wins when several records describe one entity.
int Severity(MutationStatus status) {
  switch (status) {
    case MutationStatus::kSynced:
      return 0;
    case MutationStatus::kPending:
      return 1;
    case MutationStatus::kSyncing:
      return 2;
    case MutationStatus::kFailed:
      return 3;
    case MutationStatus::kConflict:
      return 4;
  }
  return 0;
}

std::string AckServerId(const millsync::v1::SyncedEntity& ack) {
  return ack.server_id().empty() ? ack.id() : ack.server_id();
}

} // namespace

Reconciler::Reconciler(std::shared_ptr<ledger::EntityLedger> ledger, std::shared_ptr<SyncQueue> queue, std::shared_ptr<util::Clock> clock,
                       bool purge_synced)
    : ledger_(std::move(ledger)), queue_(std::move(queue)), clock_(std::move(clock)), purge_synced_(purge_synced) {
}

std::optional<MutationRecord> Reconciler::Current(db::Transaction& tx, const MutationRecord& record) {
  auto current = queue_->Find(tx, record.id);
  if (!current) {
    MILLSYNC_LOG_WARN("Mutation left the queue while in flight", {observability::StringField("id", record.id)});
  }
  return current;
}

void Reconciler::ApplySuccess(db::Transaction& tx, const MutationRecord& in_flight, const millsync::v1::SyncedEntity& ack) {
  auto record = Current(tx, in_flight);
  if (!record) return;

  if (record->status == MutationStatus::kSynced) {
    MILLSYNC_LOG_DEBUG("Mutation already synced", {observability::StringField("id", record->id)});
    return;
  }

  const uint64_t now  = clock_->NowMillis();
  auto           meta = ledger_->Raw(tx, record->Entity());

  // the ack describes the snapshot that was sent; a local edit queued since supersedes it
  bool superseded = false;
  for (const auto& other : queue_->OutstandingFor(tx, record->Entity())) {
    if (other.id != record->id) superseded = true;
  }

  // a movement or a delete acknowledges something other than the entity itself
  const bool carries_entity = IsSnapshot(record->payload);
  const auto ack_id         = carries_entity ? AckServerId(ack) : std::string{};

  if (meta) {
    if (!meta->server_id || meta->server_id->empty()) {
      if (!ack_id.empty()) meta->server_id = ack_id;
    } else if (!ack_id.empty() && ack_id != *meta->server_id) {
      MILLSYNC_LOG_WARN("Server returned a different id; keeping the first", {observability::StringField("entity", model::ToString(meta->Ref())),
                                                                              observability::StringField("kept", *meta->server_id),
                                                                              observability::StringField("returned", ack_id)});
    }
    record->entity_server_id = meta->server_id;
  } else if (!ack_id.empty() && !record->entity_server_id) {
    record->entity_server_id = ack_id;
  }

  MarkSynced(*record, now);
  queue_->Save(tx, *record);

  if (meta) {
    if (record->operation == MutationOperation::kDelete && meta->is_deleted) {
      ledger_->Remove(tx, meta->Ref());
    } else {
      if (carries_entity) {
        MergeCanonical(tx, *meta, ack, !superseded);
      }
      ledger_->Store(tx, *meta);
      RefreshEntityStatus(tx, meta->Ref());
    }
  }

  if (purge_synced_) {
    queue_->Remove(tx, record->id);
  }

  MILLSYNC_LOG_INFO("Mutation synced", {observability::StringField("id", record->id), observability::StringField("entity", model::ToString(record->Entity())),
                                       observability::StringField("op", model::OperationName(record->operation)),
                                       observability::StringField("server_id", record->entity_server_id.value_or(""))});
}

bool Reconciler::ApplyTransientFailure(db::Transaction& tx, const MutationRecord& in_flight, const std::string& error) {
  auto record = Current(tx, in_flight);
  if (!record) return false;

  const bool exhausted = MarkTransientFailure(*record, error, clock_->NowMillis());
  queue_->Save(tx, *record);
  RefreshEntityStatus(tx, record->Entity());

  if (exhausted) {
    MILLSYNC_LOG_ERROR("Mutation failed permanently", {observability::StringField("id", record->id), observability::StringField("error", error),
                                                       observability::IntField("retries", record->retry_count)});
  } else {
    MILLSYNC_LOG_WARN("Mutation will retry", {observability::StringField("id", record->id), observability::StringField("error", error),
                                              observability::IntField("retries", record->retry_count),
                                              observability::IntField("next_retry_at_ms", static_cast<int64_t>(record->next_retry_at_ms.value_or(0)))});
  }
  return exhausted;
}

void Reconciler::ApplyConflict(db::Transaction& tx, const MutationRecord& in_flight, const std::string& error) {
  auto record = Current(tx, in_flight);
  if (!record) return;

  MarkConflict(*record, error, clock_->NowMillis());
  queue_->Save(tx, *record);
  RefreshEntityStatus(tx, record->Entity());

  MILLSYNC_LOG_WARN("Mutation conflicts with server state", {observability::StringField("id", record->id),
                                                             observability::StringField("entity", model::ToString(record->Entity())),
                                                             observability::StringField("error", error)});
}

void Reconciler::ApplyReturned(db::Transaction& tx, const MutationRecord& in_flight, const std::string& reason) {
  auto record = Current(tx, in_flight);
  if (!record || record->status != MutationStatus::kSyncing) return;

  MarkReturned(*record, reason, clock_->NowMillis());
  queue_->Save(tx, *record);
  RefreshEntityStatus(tx, record->Entity());
}

void Reconciler::RefreshEntityStatus(db::Transaction& tx, model::EntityRef entity) {
  auto meta = ledger_->Raw(tx, entity);
  if (!meta) return;

  const auto records = queue_->RecordsFor(tx, entity);

  // nothing left to say, and the server never saw it: keep whatever it was
  if (records.empty() && (!meta->server_id || meta->server_id->empty())) {
    return;
  }

  MutationStatus status = MutationStatus::kSynced;
  for (const auto& record : records) {
    if (Severity(record.status) > Severity(status)) status = record.status;
  }

  if (meta->sync_status != status) {
    meta->sync_status = status;
    ledger_->Store(tx, *meta);
  }
}

void Reconciler::MergeCanonical(db::Transaction& tx, db::model::EntityRecord& meta, const millsync::v1::SyncedEntity& ack, bool take_computed) {
  auto server_of = [&](EntityType type, int64_t local_id) {
    return local_id > 0 ? ledger_->ServerIdOf(tx, {type, local_id}).value_or("") : std::string{};
  };

  switch (meta.type) {
    case EntityType::kTransaction: {
      auto txn = ledger::EntityLedger::Decode<millsync::v1::Transaction>(meta);
      if (take_computed) {
        if (ack.has_subtotal()) txn.body.set_subtotal(ack.subtotal());
        if (ack.has_total_amount()) txn.body.set_total_amount(ack.total_amount());
        if (ack.has_due_amount()) txn.body.set_due_amount(ack.due_amount());
      }
      txn.body.set_customer_server_id(server_of(EntityType::kCustomer, txn.body.customer_local_id()));
      for (auto& item : *txn.body.mutable_items()) {
        item.set_inventory_server_id(server_of(EntityType::kInventory, item.inventory_local_id()));
      }
      ledger::EntityLedger::Encode(meta, txn.body);
      break;
    }
    case EntityType::kPayment: {
      auto payment = ledger::EntityLedger::Decode<millsync::v1::Payment>(meta);
      payment.body.set_transaction_server_id(server_of(EntityType::kTransaction, payment.body.transaction_local_id()));
      ledger::EntityLedger::Encode(meta, payment.body);
      break;
    }
    case EntityType::kMilling: {
      auto milling = ledger::EntityLedger::Decode<millsync::v1::MillingRecord>(meta);
      milling.body.set_paddy_item_server_id(server_of(EntityType::kInventory, milling.body.paddy_item_local_id()));
      milling.body.set_rice_item_server_id(server_of(EntityType::kInventory, milling.body.rice_item_local_id()));
      ledger::EntityLedger::Encode(meta, milling.body);
      break;
    }
    default:
      break;
  }

  if (ack.updated_at_ms() > meta.updated_at_ms) {
    meta.updated_at_ms = ack.updated_at_ms();
  }
}

} // namespace millsync::sync
