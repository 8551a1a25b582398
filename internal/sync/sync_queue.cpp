#include "sync_queue.hpp"

#include <algorithm>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/sync/mutation_lifecycle.hpp"
#include "internal/sync/payloads.hpp"

namespace millsync::sync {

using db::model::MutationRecord;
using millsync::v1::MutationPayload;
using model::MutationOperation;
using model::MutationStatus;

namespace {

// Stock figures of an inventory Create travel with it; later movements are
// sent as deltas, so a merged snapshot must not overwrite them.
void KeepStockFigures(const millsync::v1::InventoryItem& from, millsync::v1::InventoryItem* into) {
  into->set_current_quantity(from.current_quantity());
  into->set_current_bags(from.current_bags());
  into->set_opening_quantity(from.opening_quantity());
  into->set_opening_bags(from.opening_bags());
  into->set_average_price_per_kg(from.average_price_per_kg());
}

} // namespace

SyncQueue::SyncQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock, std::shared_ptr<util::IdGenerator> ids,
                     uint32_t max_retries)
    : repository_(std::move(repository)), clock_(std::move(clock)), ids_(std::move(ids)), max_retries_(max_retries) {
}

MutationRecord SyncQueue::Enqueue(db::Transaction& tx, EnqueueRequest request) {
  if (request.operation == MutationOperation::kUnspecified || request.payload.body_case() == MutationPayload::BODY_NOT_SET) {
    throw util::ValidationError("mutation for " + model::ToString(request.entity) + " has no operation or payload");
  }

  MutationRecord merged;
  if (TryCoalesce(tx, request, merged)) {
    return merged;
  }

  const uint64_t now = clock_->NowMillis();

  MutationRecord record;
  record.id               = ids_->Next();
  record.sequence         = static_cast<uint64_t>(repository_->NextSequence(tx, "mutation"));
  record.entity_type      = request.entity.type;
  record.entity_id        = request.entity.local_id;
  record.entity_server_id = request.entity_server_id;
  record.operation        = request.operation;
  record.status           = MutationStatus::kPending;
  record.priority         = request.priority;
  record.payload          = std::move(request.payload);
  record.depends_on       = std::move(request.depends_on);
  record.max_retries      = max_retries_;
  record.created_at_ms    = now;
  record.updated_at_ms    = now;

  db::ThrowIfDbError(repository_->InsertMutation(tx, record), "enqueue mutation");

  MILLSYNC_LOG_DEBUG("Mutation enqueued", {observability::StringField("id", record.id), observability::StringField("entity", model::ToString(record.Entity())),
                                          observability::StringField("op", model::OperationName(record.operation)),
                                          observability::IntField("sequence", static_cast<int64_t>(record.sequence))});
  return record;
}

bool SyncQueue::TryCoalesce(db::Transaction& tx, const EnqueueRequest& request, MutationRecord& merged) {
  if (request.operation != MutationOperation::kUpdate || !IsSnapshot(request.payload)) {
    return false;
  }

  const auto outstanding = OutstandingFor(tx, request.entity);
  if (outstanding.empty()) {
    return false;
  }

  MutationRecord last = outstanding.back();
  if (last.status != MutationStatus::kPending || last.last_attempt_at_ms || last.payload.body_case() != request.payload.body_case()) {
    return false;
  }
  if (last.operation != MutationOperation::kCreate && last.operation != MutationOperation::kUpdate) {
    return false;
  }

  const MutationPayload previous = last.payload;
  last.payload                   = request.payload;
  if (last.operation == MutationOperation::kCreate && previous.has_inventory()) {
    KeepStockFigures(previous.inventory(), last.payload.mutable_inventory());
  }

  for (const auto& dep : request.depends_on) {
    if (std::find(last.depends_on.begin(), last.depends_on.end(), dep) == last.depends_on.end()) {
      last.depends_on.push_back(dep);
    }
  }
  if (request.priority > last.priority) {
    last.priority = request.priority;
  }
  if (!last.entity_server_id && request.entity_server_id) {
    last.entity_server_id = request.entity_server_id;
  }
  last.updated_at_ms = clock_->NowMillis();

  Save(tx, last);

  MILLSYNC_LOG_DEBUG("Mutation coalesced", {observability::StringField("id", last.id), observability::StringField("entity", model::ToString(last.Entity()))});

  merged = std::move(last);
  return true;
}

std::vector<MutationRecord> SyncQueue::SelectEligible(db::Transaction& tx, std::optional<std::size_t> limit) {
  const auto     all = repository_->ListMutations(tx, {});
  const uint64_t now = clock_->NowMillis();

  // listing is in sequence order, so the first non-terminal hit per entity is the head
  std::map<model::EntityRef, uint64_t> heads;
  for (const auto& record : all) {
    if (model::IsTerminal(record.status)) continue;
    heads.try_emplace(record.Entity(), record.sequence);
  }

  std::vector<MutationRecord> eligible;
  for (const auto& record : all) {
    if (record.status != MutationStatus::kPending) continue;
    if (record.next_retry_at_ms && now < *record.next_retry_at_ms) continue;
    if (heads[record.Entity()] != record.sequence) continue;
    eligible.push_back(record);
  }

  std::sort(eligible.begin(), eligible.end(), [](const MutationRecord& a, const MutationRecord& b) {
    if (a.priority != b.priority) return a.priority > b.priority;
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.sequence < b.sequence;
  });

  if (limit && eligible.size() > *limit) {
    eligible.resize(*limit);
  }
  return eligible;
}

std::size_t SyncQueue::PendingCount(db::Transaction& tx) {
  std::size_t count = 0;
  for (const auto& record : repository_->ListMutations(tx, {})) {
    if (model::IsOutstanding(record.status)) ++count;
  }
  return count;
}

std::vector<MutationRecord> SyncQueue::ListByStatus(db::Transaction& tx, std::optional<MutationStatus> status) {
  db::MutationFilter filter;
  filter.status = status;
  return repository_->ListMutations(tx, filter);
}

std::vector<MutationRecord> SyncQueue::OutstandingFor(db::Transaction& tx, model::EntityRef entity) {
  std::vector<MutationRecord> out;
  for (auto& record : RecordsFor(tx, entity)) {
    if (model::IsOutstanding(record.status)) out.push_back(std::move(record));
  }
  return out;
}

std::vector<MutationRecord> SyncQueue::RecordsFor(db::Transaction& tx, model::EntityRef entity) {
  db::MutationFilter filter;
  filter.entity = entity;
  return repository_->ListMutations(tx, filter);
}

std::optional<MutationRecord> SyncQueue::Find(db::Transaction& tx, const std::string& id) {
  return repository_->GetMutation(tx, id);
}

MutationRecord SyncQueue::Get(db::Transaction& tx, const std::string& id) {
  auto record = Find(tx, id);
  if (!record) {
    throw util::NotFound("mutation " + id + " not found");
  }
  return std::move(*record);
}

void SyncQueue::Save(db::Transaction& tx, const MutationRecord& record) {
  db::ThrowIfDbError(repository_->UpdateMutation(tx, record), "update mutation " + record.id);
}

void SyncQueue::Remove(db::Transaction& tx, const std::string& id) {
  db::ThrowIfDbError(repository_->DeleteMutation(tx, id), "delete mutation " + id);
}

std::size_t SyncQueue::PurgeSynced(db::Transaction& tx) {
  const auto synced = ListByStatus(tx, MutationStatus::kSynced);
  for (const auto& record : synced) {
    Remove(tx, record.id);
  }
  return synced.size();
}

MutationRecord SyncQueue::ResetForRetry(db::Transaction& tx, const std::string& id, const std::optional<MutationPayload>& current) {
  auto record = Get(tx, id);
  sync::ResetForRetry(record, clock_->NowMillis());

  if (current && IsSnapshot(record.payload) && current->body_case() == record.payload.body_case()) {
    MutationPayload refreshed = *current;
    if (record.operation == MutationOperation::kCreate && record.payload.has_inventory()) {
      KeepStockFigures(record.payload.inventory(), refreshed.mutable_inventory());
    }
    record.payload = std::move(refreshed);
  }

  Save(tx, record);
  return record;
}

std::vector<MutationRecord> SyncQueue::ResetAllFailed(db::Transaction& tx) {
  const uint64_t now   = clock_->NowMillis();
  auto           reset = ListByStatus(tx, MutationStatus::kFailed);
  for (auto& record : reset) {
    sync::ResetForRetry(record, now);
    Save(tx, record);
  }
  return reset;
}

MutationRecord SyncQueue::Discard(db::Transaction& tx, const std::string& id) {
  auto record = Get(tx, id);
  if (record.status != MutationStatus::kFailed && record.status != MutationStatus::kConflict) {
    throw util::InvalidState("mutation " + id + " is " + std::string(model::StatusName(record.status)) + ", only failed or conflicting records can be discarded");
  }
  Remove(tx, id);

  MILLSYNC_LOG_WARN("Mutation discarded", {observability::StringField("id", id), observability::StringField("entity", model::ToString(record.Entity())),
                                          observability::StringField("op", model::OperationName(record.operation))});
  return record;
}

std::size_t SyncQueue::RecoverInFlight(db::Transaction& tx) {
  const uint64_t now       = clock_->NowMillis();
  std::size_t    recovered = 0;

  for (auto& record : ListByStatus(tx, MutationStatus::kSyncing)) {
    MarkReturned(record, "interrupted while syncing", now);
    Save(tx, record);
    ++recovered;
  }
  return recovered;
}

QueueStats SyncQueue::Stats(db::Transaction& tx) {
  QueueStats stats;
  for (const auto& record : repository_->ListMutations(tx, {})) {
    switch (record.status) {
      case MutationStatus::kPending:
        ++stats.pending;
        break;
      case MutationStatus::kSyncing:
        ++stats.syncing;
        break;
      case MutationStatus::kSynced:
        ++stats.synced;
        break;
      case MutationStatus::kFailed:
        ++stats.failed;
        break;
      case MutationStatus::kConflict:
        ++stats.conflict;
        break;
    }
    if (record.status != MutationStatus::kSynced) {
      ++stats.unsynced_by_type[record.entity_type];
    }
  }
  return stats;
}

} // namespace millsync::sync
