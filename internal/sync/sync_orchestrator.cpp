#include "sync_orchestrator.hpp"

#include <algorithm>
#include <map>

#include "internal/observability/logging.hpp"
#include "internal/remote/endpoints.hpp"
#include "internal/remote/json_codec.hpp"
#include "internal/sync/mutation_lifecycle.hpp"
#include "internal/sync/payloads.hpp"

namespace millsync::sync {

using db::model::MutationRecord;
using model::EntityType;
using model::MutationOperation;
using model::MutationStatus;

namespace {

constexpr EntityType kHealOrder[] = {EntityType::kCustomer, EntityType::kInventory, EntityType::kTransaction,
                                     EntityType::kPayment,  EntityType::kMilling,   EntityType::kUser};

constexpr EntityType kPullOrder[] = {EntityType::kCustomer, EntityType::kInventory, EntityType::kTransaction};

std::string AckServerId(const millsync::v1::SyncedEntity& ack) {
  return ack.server_id().empty() ? ack.id() : ack.server_id();
}

bool IsUnreachable(const remote::RemoteResult& result) {
  return !result && result.failure().kind == util::FailureKind::kNetwork;
}

bool NeedsServerId(const MutationRecord& record) {
  return record.operation == MutationOperation::kCreate && IsSnapshot(record.payload);
}

util::Failure FailureOf(const remote::RemoteResult& result) {
  if (!result) return result.failure();

  const int code    = result.value().status_code;
  auto      message = DescribeResult(result);
  if (code == 401 || code == 403) return util::Failure::Auth(std::move(message), code);
  if (code == 404) return util::Failure{util::FailureKind::kNotFound, std::move(message), code};
  if (code >= 400 && code < 500) return util::Failure::Validation(std::move(message), code);
  return util::Failure::Server(std::move(message), code);
}

} // namespace

SyncOrchestrator::SyncOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::EntityLedger> ledger,
                                   std::shared_ptr<SyncQueue> queue, std::shared_ptr<Reconciler> reconciler, std::shared_ptr<PullMerger> puller,
                                   std::shared_ptr<remote::RemoteApi> remote, std::shared_ptr<SyncStatusTracker> status,
                                   std::shared_ptr<util::Clock> clock, SyncOptions options)
    : repository_(std::move(repository)),
      ledger_(std::move(ledger)),
      queue_(std::move(queue)),
      reconciler_(std::move(reconciler)),
      puller_(std::move(puller)),
      remote_(std::move(remote)),
      status_(std::move(status)),
      clock_(std::move(clock)),
      options_(options) {
  if (options_.batch_size == 0) options_.batch_size = 1;
}

void SyncOrchestrator::Cancel() {
  cancel_.Cancel();
}

std::size_t SyncOrchestrator::RecoverInFlight() {
  std::lock_guard lock(pass_mutex_);

  auto       tx        = repository_->Begin();
  const auto recovered = queue_->RecoverInFlight(*tx);
  tx->Commit();

  if (recovered > 0) {
    MILLSYNC_LOG_WARN("Recovered in-flight mutations", {observability::IntField("count", static_cast<int64_t>(recovered))});
  }
  return recovered;
}

SyncPassResult SyncOrchestrator::RunSyncPass(const util::CancelToken* stop) {
  SyncPassResult result;

  std::unique_lock lock(pass_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    result.already_running = true;
    return result;
  }

  running_ = true;
  cancel_.Reset();
  if (stop && stop->IsCancelled()) cancel_.Cancel();
  status_->BeginPass();
  MILLSYNC_LOG_INFO("Sync pass started");

  try {
    {
      auto tx          = repository_->Begin();
      result.recovered = queue_->RecoverInFlight(*tx);
      tx->Commit();
    }
    result.healed = SelfHeal();

    status_->SetPhase(SyncPhase::kPushing);
    Push(result);

    if (options_.pull_enabled && !ShouldStop(result)) {
      status_->SetPhase(SyncPhase::kPulling);
      Pull(result);
    }
  } catch (const std::exception& e) {
    result.errors.push_back(e.what());
    MILLSYNC_LOG_ERROR("Sync pass aborted", {observability::StringField("error", e.what())});
  }

  status_->SetPhase(SyncPhase::kFinalizing);
  Finish(result);

  running_ = false;
  return result;
}

util::Outcome<bool> SyncOrchestrator::KeepServerCopy(const std::string& record_id) {
  std::lock_guard lock(pass_mutex_);

  try {
    MutationRecord          record;
    db::model::EntityRecord meta;
    {
      auto tx = repository_->Begin();
      record  = queue_->Get(*tx, record_id);
      if (record.status != MutationStatus::kConflict && record.status != MutationStatus::kFailed) {
        throw util::InvalidState("mutation " + record_id + " is " + std::string(model::StatusName(record.status)) + ", nothing to resolve");
      }
      if (!PullMerger::SupportsPull(record.entity_type)) {
        throw util::ValidationError(std::string(model::EntityTypeName(record.entity_type)) + " cannot be fetched from the server");
      }
      auto found = ledger_->Raw(*tx, record.Entity());
      if (!found || !found->server_id || found->server_id->empty()) {
        throw util::ValidationError(model::ToString(record.Entity()) + " never reached the server; discard the change instead");
      }
      meta = std::move(*found);
    }

    util::CancelToken cancel;
    const auto        response = remote_->Get(remote::CollectionPath(meta.type) + "/" + *meta.server_id, cancel);
    if (!response || !response.value().success) {
      auto failure = FailureOf(response);
      MILLSYNC_LOG_WARN("Could not fetch server copy", {observability::StringField("id", record_id), observability::StringField("error", failure.message)});
      return util::Outcome<bool>::Fail(std::move(failure));
    }

    auto tx = repository_->Begin();
    for (const auto& other : queue_->RecordsFor(*tx, meta.Ref())) {
      const bool superseded = IsSnapshot(other.payload) || other.operation == MutationOperation::kDelete;
      if (other.id == record_id || (other.status != MutationStatus::kSynced && superseded)) {
        queue_->Remove(*tx, other.id);
      }
    }
    puller_->ApplyServerCopy(*tx, meta.Ref(), response.value().data);
    reconciler_->RefreshEntityStatus(*tx, meta.Ref());
    tx->Commit();

    MILLSYNC_LOG_INFO("Conflict resolved with server copy", {observability::StringField("id", record_id),
                                                             observability::StringField("entity", model::ToString(meta.Ref()))});
    return util::Outcome<bool>::Ok(true);
  } catch (const std::exception& e) {
    return util::Outcome<bool>::Fail(util::ToFailure(e));
  }
}

// An unreachable server ends the pass; records not yet sent stay Pending.
bool SyncOrchestrator::ShouldStop(const SyncPassResult& result) const {
  return cancel_.IsCancelled() || result.auth_required || result.unreachable;
}

// ------------------------------------------------------------------
// Self-heal
// ------------------------------------------------------------------

std::size_t SyncOrchestrator::SelfHeal() {
  auto        tx     = repository_->Begin();
  std::size_t healed = 0;

  db::EntityFilter filter;
  filter.unsynced_only = true;

  for (const auto type : kHealOrder) {
    for (const auto& meta : repository_->ListEntities(*tx, type, filter)) {
      if (meta.sync_status == MutationStatus::kFailed || meta.sync_status == MutationStatus::kConflict) continue;

      const auto records = queue_->RecordsFor(*tx, meta.Ref());
      const bool tracked = std::any_of(records.begin(), records.end(), [](const auto& r) { return r.status != MutationStatus::kSynced; });
      if (tracked) continue;

      const bool known = meta.server_id && !meta.server_id->empty();
      if (meta.is_deleted && !known) {
        ledger_->Remove(*tx, meta.Ref());
        ++healed;
        continue;
      }

      EnqueueRequest request;
      request.entity           = meta.Ref();
      request.entity_server_id = known ? meta.server_id : std::nullopt;
      request.operation        = meta.is_deleted ? MutationOperation::kDelete : (known ? MutationOperation::kUpdate : MutationOperation::kCreate);
      request.payload          = SnapshotOf(meta);
      request.depends_on       = DependenciesOf(request.payload);
      queue_->Enqueue(*tx, std::move(request));
      ++healed;

      MILLSYNC_LOG_WARN("Re-enqueued untracked change", {observability::StringField("entity", model::ToString(meta.Ref()))});
    }
  }

  tx->Commit();
  return healed;
}

// ------------------------------------------------------------------
// Push
// ------------------------------------------------------------------

void SyncOrchestrator::Push(SyncPassResult& result) {
  std::set<std::string> attempted;
  std::set<std::string> deferred;

  while (!ShouldStop(result) && result.attempted < options_.max_records_per_pass) {
    const std::size_t budget = std::min(options_.batch_size, options_.max_records_per_pass - result.attempted);

    auto round = Claim(attempted, deferred, budget, result);
    if (round.empty()) break;

    result.attempted += round.size();
    Transmit(round, result);
  }

  for (const auto& id : deferred) {
    if (!attempted.contains(id)) ++result.deferred;
  }
}

std::vector<SyncOrchestrator::InFlight> SyncOrchestrator::Claim(std::set<std::string>& attempted, std::set<std::string>& deferred, std::size_t budget,
                                                                SyncPassResult& result) {
  std::vector<InFlight> round;
  const uint64_t        now = clock_->NowMillis();

  auto tx = repository_->Begin();
  try {
    for (auto& record : queue_->SelectEligible(*tx)) {
      if (round.size() >= budget) break;
      if (attempted.contains(record.id)) continue;

      auto resolution = ResolveOutbound(*tx, *ledger_, record);
      if (resolution.kind == Resolution::Kind::kDeferred) {
        if (deferred.insert(record.id).second) {
          MILLSYNC_LOG_DEBUG("Mutation deferred", {observability::StringField("id", record.id), observability::StringField("reason", resolution.reason)});
        }
        continue;
      }

      if (!locks_.TryAcquire(record.Entity(), record.id)) {
        deferred.insert(record.id);
        continue;
      }

      MarkSyncing(record, now);
      queue_->Save(*tx, record);
      attempted.insert(record.id);

      if (resolution.kind == Resolution::Kind::kOrphaned) {
        reconciler_->ApplyConflict(*tx, record, resolution.reason);
        locks_.Release(record.Entity(), record.id);
        ++result.attempted;
        ++result.conflicted;
        continue;
      }

      round.push_back(InFlight{std::move(record), std::move(resolution.payload)});
    }
    tx->Commit();
  } catch (const std::exception&) {
    for (const auto& item : round) {
      locks_.Release(item.record.Entity(), item.record.id);
    }
    throw;
  }

  return round;
}

void SyncOrchestrator::Transmit(std::vector<InFlight>& round, SyncPassResult& result) {
  std::map<EntityType, std::vector<const InFlight*>> batches;
  std::vector<const InFlight*>                       singles;

  for (const auto& item : round) {
    const auto& record = item.record;
    if (options_.use_batch_endpoints && NeedsServerId(record) && remote::SupportsBatch(record.entity_type)) {
      batches[record.entity_type].push_back(&item);
    } else {
      singles.push_back(&item);
    }
  }

  for (auto& [type, group] : batches) {
    if (group.size() == 1) {
      singles.push_back(group.front());
      continue;
    }
    if (ShouldStop(result)) {
      for (const auto* item : group) ReturnUnsent(*item, cancel_.IsCancelled(), result);
      continue;
    }
    SendBatch(type, group, result);
  }

  for (const auto* item : singles) {
    if (ShouldStop(result)) {
      ReturnUnsent(*item, cancel_.IsCancelled(), result);
      continue;
    }
    SendOne(*item, result);
  }
}

void SyncOrchestrator::SendOne(const InFlight& item, SyncPassResult& result) {
  const auto& record = item.record;

  remote::Request request;
  try {
    request = remote::BuildPushRequest(record, item.outbound);
  } catch (const util::ValidationError& e) {
    Settle(item, Classification::kSemanticConflict, {}, e.what(), result);
    return;
  } catch (const std::exception& e) {
    Settle(item, Classification::kTransientFailure, {}, e.what(), result);
    return;
  }

  MILLSYNC_LOG_DEBUG("Sending mutation", {observability::StringField("id", record.id), observability::StringField("method", remote::MethodName(request.method)),
                                         observability::StringField("path", request.path)});

  const auto response = remote::Send(*remote_, request, cancel_);
  auto       outcome  = Classify(response, record.operation, cancel_);
  if (IsUnreachable(response)) result.unreachable = true;

  millsync::v1::SyncedEntity ack;
  std::string                detail;

  if (outcome == Classification::kSuccess) {
    if (response && !response.value().data.empty()) {
      try {
        remote::FromJson(response.value().data, &ack);
      } catch (const util::ValidationError& e) {
        outcome = Classification::kTransientFailure;
        detail  = e.what();
      }
    }
    if (outcome == Classification::kSuccess && NeedsServerId(record) && AckServerId(ack).empty()) {
      outcome = Classification::kTransientFailure;
      detail  = "server response carried no id";
    }
  } else {
    detail = DescribeResult(response);
  }

  Settle(item, outcome, ack, detail, result);
}

void SyncOrchestrator::SendBatch(EntityType type, const std::vector<const InFlight*>& group, SyncPassResult& result) {
  std::string body;
  try {
    switch (type) {
      case EntityType::kCustomer: {
        millsync::v1::CustomerList list;
        for (const auto* item : group) *list.add_customers() = item->outbound.customer();
        body = remote::ToJson(list);
        break;
      }
      case EntityType::kInventory: {
        millsync::v1::InventoryList list;
        for (const auto* item : group) *list.add_inventory() = item->outbound.inventory();
        body = remote::ToJson(list);
        break;
      }
      case EntityType::kTransaction: {
        millsync::v1::TransactionList list;
        for (const auto* item : group) *list.add_transactions() = item->outbound.transaction();
        body = remote::ToJson(list);
        break;
      }
      default:
        throw util::ValidationError(std::string(model::EntityTypeName(type)) + " has no batch endpoint");
    }
  } catch (const std::exception& e) {
    for (const auto* item : group) Settle(*item, Classification::kSemanticConflict, {}, e.what(), result);
    return;
  }

  MILLSYNC_LOG_DEBUG("Sending batch", {observability::StringField("type", model::EntityTypeName(type)),
                                      observability::IntField("records", static_cast<int64_t>(group.size()))});

  const auto response = remote_->Post(remote::BatchPath(type), body, cancel_);
  const auto outcome  = Classify(response, MutationOperation::kCreate, cancel_);
  if (IsUnreachable(response)) result.unreachable = true;

  if (outcome != Classification::kSuccess) {
    const auto detail = DescribeResult(response);
    for (const auto* item : group) Settle(*item, outcome, {}, detail, result);
    return;
  }

  millsync::v1::BatchSyncResponse parsed;
  try {
    remote::FromJson(response.value().data, &parsed);
  } catch (const util::ValidationError& e) {
    for (const auto* item : group) Settle(*item, Classification::kTransientFailure, {}, e.what(), result);
    return;
  }

  std::map<int64_t, millsync::v1::SyncedEntity>   synced;
  std::map<int64_t, millsync::v1::RejectedEntity> rejected;
  for (const auto& entry : parsed.synced()) synced[entry.local_id()] = entry;
  for (const auto& entry : parsed.rejected()) rejected[entry.local_id()] = entry;

  for (const auto* item : group) {
    const int64_t local_id = item->record.entity_id;

    if (auto it = synced.find(local_id); it != synced.end()) {
      if (AckServerId(it->second).empty()) {
        Settle(*item, Classification::kTransientFailure, {}, "batch entry carried no id", result);
      } else {
        Settle(*item, Classification::kSuccess, it->second, {}, result);
      }
    } else if (auto rt = rejected.find(local_id); rt != rejected.end()) {
      const auto code = rt->second.status_code();
      Settle(*item, ClassifyStatus(code, MutationOperation::kCreate), {}, "HTTP " + std::to_string(code) + ": " + rt->second.message(), result);
    } else {
      Settle(*item, Classification::kTransientFailure, {}, "missing from batch response", result);
    }
  }
}

void SyncOrchestrator::Settle(const InFlight& item, Classification outcome, const millsync::v1::SyncedEntity& ack, const std::string& detail,
                              SyncPassResult& result) {
  const auto& record    = item.record;
  bool        exhausted = false;

  try {
    auto tx = repository_->Begin();
    switch (outcome) {
      case Classification::kSuccess:
        reconciler_->ApplySuccess(*tx, record, ack);
        break;
      case Classification::kTransientFailure:
        exhausted = reconciler_->ApplyTransientFailure(*tx, record, detail);
        break;
      case Classification::kSemanticConflict:
        reconciler_->ApplyConflict(*tx, record, detail);
        break;
      case Classification::kAuthRequired:
        reconciler_->ApplyReturned(*tx, record, detail);
        break;
      case Classification::kCancelled:
        reconciler_->ApplyReturned(*tx, record, "cancelled");
        break;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    locks_.Release(record.Entity(), record.id);
    result.errors.push_back("settle " + record.id + ": " + e.what());
    MILLSYNC_LOG_ERROR("Failed to record sync outcome", {observability::StringField("id", record.id),
                                                         observability::StringField("outcome", ClassificationName(outcome)),
                                                         observability::StringField("error", e.what())});
    return;
  }
  locks_.Release(record.Entity(), record.id);

  switch (outcome) {
    case Classification::kSuccess:
      ++result.succeeded;
      break;
    case Classification::kTransientFailure:
      if (exhausted) {
        ++result.failed;
      } else {
        ++result.retried;
      }
      break;
    case Classification::kSemanticConflict:
      ++result.conflicted;
      break;
    case Classification::kAuthRequired:
      if (!result.auth_required) {
        MILLSYNC_LOG_WARN("Server rejected credentials; stopping pass", {observability::StringField("detail", detail)});
      }
      result.auth_required = true;
      break;
    case Classification::kCancelled:
      ++result.cancelled;
      break;
  }
}

void SyncOrchestrator::ReturnUnsent(const InFlight& item, bool cancelled, SyncPassResult& result) {
  const auto& record = item.record;
  try {
    auto tx = repository_->Begin();
    reconciler_->ApplyReturned(*tx, record, cancelled ? "cancelled" : "not sent");
    tx->Commit();
  } catch (const std::exception& e) {
    result.errors.push_back("return " + record.id + ": " + e.what());
  }
  locks_.Release(record.Entity(), record.id);

  --result.attempted;
  if (cancelled) {
    ++result.cancelled;
  } else {
    ++result.deferred;
  }
}

// ------------------------------------------------------------------
// Pull
// ------------------------------------------------------------------

void SyncOrchestrator::Pull(SyncPassResult& result) {
  for (const auto type : kPullOrder) {
    if (ShouldStop(result)) break;

    const std::string name(model::EntityTypeName(type));
    try {
      std::optional<uint64_t> since;
      {
        auto tx = repository_->Begin();
        since   = puller_->Cursor(*tx, type);
        tx->Commit();
      }

      const auto response = remote_->Get(remote::UpdatesPath(type, since), cancel_);
      const auto outcome  = Classify(response, MutationOperation::kUpdate, cancel_);
      if (outcome == Classification::kCancelled) break;
      if (outcome == Classification::kAuthRequired) {
        result.auth_required = true;
        break;
      }
      if (outcome != Classification::kSuccess) {
        if (IsUnreachable(response)) result.unreachable = true;
        result.errors.push_back("pull " + name + ": " + DescribeResult(response));
        continue;
      }
      if (response.value().data.empty()) continue;

      auto tx     = repository_->Begin();
      auto merged = puller_->Merge(*tx, type, response.value().data);
      tx->Commit();
      result.pulled += merged.applied;

      MILLSYNC_LOG_DEBUG("Pulled remote changes", {observability::StringField("type", name), observability::IntField("received", static_cast<int64_t>(merged.received)),
                                                  observability::IntField("applied", static_cast<int64_t>(merged.applied))});
    } catch (const std::exception& e) {
      result.errors.push_back("pull " + name + ": " + e.what());
      MILLSYNC_LOG_WARN("Pull failed", {observability::StringField("type", name), observability::StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------------
// Finish
// ------------------------------------------------------------------

void SyncOrchestrator::Finish(SyncPassResult& result) {
  try {
    auto       tx    = repository_->Begin();
    const auto stats = queue_->Stats(*tx);
    tx->Commit();
    status_->SetCounts(stats.pending + stats.syncing, stats.failed, stats.conflict);
  } catch (const std::exception& e) {
    result.errors.push_back(std::string("stats: ") + e.what());
  }

  SyncState   state = SyncState::kSuccess;
  std::string error;
  if (cancel_.IsCancelled()) {
    state = SyncState::kCancelled;
  } else if (result.auth_required) {
    state = SyncState::kError;
    error = "authentication required";
  } else if (result.unreachable && result.succeeded == 0) {
    state = SyncState::kOffline;
    error = result.errors.empty() ? "server unreachable" : result.errors.front();
  } else if (!result.errors.empty()) {
    state = SyncState::kError;
    error = result.errors.front();
  }

  const bool completed = state == SyncState::kSuccess;
  status_->FinishPass(state, error, completed ? std::optional<uint64_t>(clock_->NowMillis()) : std::nullopt, result.auth_required);

  MILLSYNC_LOG_INFO("Sync pass finished", {observability::StringField("state", SyncStateName(state)),
                                          observability::IntField("attempted", static_cast<int64_t>(result.attempted)),
                                          observability::IntField("succeeded", static_cast<int64_t>(result.succeeded)),
                                          observability::IntField("retried", static_cast<int64_t>(result.retried)),
                                          observability::IntField("failed", static_cast<int64_t>(result.failed)),
                                          observability::IntField("conflicted", static_cast<int64_t>(result.conflicted)),
                                          observability::IntField("deferred", static_cast<int64_t>(result.deferred)),
                                          observability::IntField("pulled", static_cast<int64_t>(result.pulled))});
}

} // namespace millsync::sync
