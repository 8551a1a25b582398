#pragma once

#include <memory>
#include <string>

#include "internal/ledger/entity_ledger.hpp"
#include "internal/sync/sync_queue.hpp"
#include "millsync/v1/remote.pb.h"

namespace millsync::sync {

/*
  Writes the outcome of one transmission back into the queue and the ledger.

  This is the sync engine's whole write authority over entities: fill
  server_id, flip sync_status, merge server-computed values, and hard-remove
  tombstones whose Delete went through. Stock is never touched here.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<ledger::EntityLedger> ledger, std::shared_ptr<SyncQueue> queue, std::shared_ptr<util::Clock> clock,
             bool purge_synced = false);

  // Idempotent: a record that is already Synced leaves everything as is.
  void ApplySuccess(db::Transaction& tx, const db::model::MutationRecord& record, const millsync::v1::SyncedEntity& ack);

  // Returns true when the retry budget ran out and the record is now Failed.
  bool ApplyTransientFailure(db::Transaction& tx, const db::model::MutationRecord& record, const std::string& error);

  void ApplyConflict(db::Transaction& tx, const db::model::MutationRecord& record, const std::string& error);

  // Back to Pending with no retry consumed (cancelled, credentials rejected, never sent).
  void ApplyReturned(db::Transaction& tx, const db::model::MutationRecord& record, const std::string& reason);

  // Recomputes an entity's sync_status from its queue records.
  void RefreshEntityStatus(db::Transaction& tx, model::EntityRef entity);

 private:
  // Current copy of an in-flight record, or nullopt when it left the queue meanwhile.
  std::optional<db::model::MutationRecord> Current(db::Transaction& tx, const db::model::MutationRecord& record);

  // Server ids of references always; server-computed totals only when take_computed.
  void MergeCanonical(db::Transaction& tx, db::model::EntityRecord& meta, const millsync::v1::SyncedEntity& ack, bool take_computed);

  std::shared_ptr<ledger::EntityLedger> ledger_;
  std::shared_ptr<SyncQueue>            queue_;
  std::shared_ptr<util::Clock>          clock_;
  bool                                  purge_synced_;
};

} // namespace millsync::sync
