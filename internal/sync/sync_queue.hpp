#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace millsync::sync {

struct EnqueueRequest {
  model::EntityRef               entity;
  std::optional<std::string>     entity_server_id;
  model::MutationOperation       operation = model::MutationOperation::kUnspecified;
  model::MutationPriority        priority  = model::MutationPriority::kNormal;
  millsync::v1::MutationPayload  payload;
  std::vector<model::EntityRef>  depends_on;
};

struct QueueStats {
  std::size_t pending  = 0;
  std::size_t syncing  = 0;
  std::size_t synced   = 0;
  std::size_t failed   = 0;
  std::size_t conflict = 0;

  // records not yet Synced, per entity type
  std::map<model::EntityType, std::size_t> unsynced_by_type;

  std::size_t Total() const {
    return pending + syncing + synced + failed + conflict;
  }
};

/*
  Durable FIFO of MutationRecords on top of the repository.

  Every call takes the caller's transaction so a domain write and the records
  it enqueues commit together. Within one entity records are sent strictly in
  enqueue order; across entities, priority decides.
*/
class SyncQueue {
 public:
  SyncQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<util::IdGenerator> ids,
            uint32_t max_retries = 3);

  /*
    Appends a record, or folds an Update snapshot into the entity's newest
    record when that record is still Pending, has never been attempted and
    carries the same kind of snapshot. Returns the stored record.
  */
  db::model::MutationRecord Enqueue(db::Transaction& tx, EnqueueRequest request);

  // Pending, out of backoff, and first in line for its entity. Sorted for draining.
  std::vector<db::model::MutationRecord> SelectEligible(db::Transaction& tx, std::optional<std::size_t> limit = std::nullopt);

  std::size_t PendingCount(db::Transaction& tx);

  std::vector<db::model::MutationRecord> ListByStatus(db::Transaction& tx, std::optional<model::MutationStatus> status);

  // Pending or Syncing records of one entity, oldest first.
  std::vector<db::model::MutationRecord> OutstandingFor(db::Transaction& tx, model::EntityRef entity);

  std::vector<db::model::MutationRecord> RecordsFor(db::Transaction& tx, model::EntityRef entity);

  std::optional<db::model::MutationRecord> Find(db::Transaction& tx, const std::string& id);

  // util::NotFound when missing.
  db::model::MutationRecord Get(db::Transaction& tx, const std::string& id);

  void Save(db::Transaction& tx, const db::model::MutationRecord& record);

  void Remove(db::Transaction& tx, const std::string& id);

  std::size_t PurgeSynced(db::Transaction& tx);

  // Failed|Conflict -> Pending. A snapshot payload is refreshed from `current` when given.
  db::model::MutationRecord ResetForRetry(db::Transaction& tx, const std::string& id,
                                          const std::optional<millsync::v1::MutationPayload>& current = std::nullopt);

  // Every Failed record back to Pending. Returns the records reset.
  std::vector<db::model::MutationRecord> ResetAllFailed(db::Transaction& tx);

  // Only Failed or Conflict records can be discarded. Returns the removed record.
  db::model::MutationRecord Discard(db::Transaction& tx, const std::string& id);

  // Syncing -> Pending for records left in flight by a crash or an aborted pass.
  std::size_t RecoverInFlight(db::Transaction& tx);

  QueueStats Stats(db::Transaction& tx);

  uint32_t max_retries() const {
    return max_retries_;
  }

 private:
  bool TryCoalesce(db::Transaction& tx, const EnqueueRequest& request, db::model::MutationRecord& merged);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<util::Clock>       clock_;
  std::shared_ptr<util::IdGenerator> ids_;
  uint32_t                           max_retries_;
};

} // namespace millsync::sync
