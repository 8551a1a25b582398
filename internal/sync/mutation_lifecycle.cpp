#include "mutation_lifecycle.hpp"

#include "internal/sync/backoff.hpp"
#include "internal/util/errors.hpp"

namespace millsync::sync {

using model::MutationStatus;

namespace {

void Transition(db::model::MutationRecord& record, MutationStatus to, uint64_t now_ms) {
  if (!model::CanTransition(record.status, to)) {
    throw util::InvalidState("mutation " + record.id + ": illegal transition " + std::string(model::StatusName(record.status)) + " -> " +
                             std::string(model::StatusName(to)));
  }
  record.status        = to;
  record.updated_at_ms = now_ms;
}

} // namespace

void MarkSyncing(db::model::MutationRecord& record, uint64_t now_ms) {
  Transition(record, MutationStatus::kSyncing, now_ms);
  record.last_attempt_at_ms = now_ms;
}

void MarkSynced(db::model::MutationRecord& record, uint64_t now_ms) {
  Transition(record, MutationStatus::kSynced, now_ms);
  record.error_message.clear();
  record.next_retry_at_ms.reset();
}

bool MarkTransientFailure(db::model::MutationRecord& record, const std::string& error, uint64_t now_ms) {
  if (record.status != MutationStatus::kSyncing) {
    throw util::InvalidState("mutation " + record.id + ": transient failure outside a sync attempt");
  }

  record.retry_count += 1;
  record.error_message = error;

  if (record.retry_count >= record.max_retries) {
    Transition(record, MutationStatus::kFailed, now_ms);
    record.next_retry_at_ms.reset();
    return true;
  }

  Transition(record, MutationStatus::kPending, now_ms);
  const auto delay        = std::chrono::duration_cast<std::chrono::milliseconds>(BackoffDelay(record.retry_count));
  record.next_retry_at_ms = now_ms + static_cast<uint64_t>(delay.count());
  return false;
}

void MarkConflict(db::model::MutationRecord& record, const std::string& error, uint64_t now_ms) {
  if (record.status != MutationStatus::kSyncing) {
    throw util::InvalidState("mutation " + record.id + ": conflict outside a sync attempt");
  }
  Transition(record, MutationStatus::kConflict, now_ms);
  record.error_message = error;
  record.next_retry_at_ms.reset();
}

void MarkReturned(db::model::MutationRecord& record, const std::string& error, uint64_t now_ms) {
  if (record.status != MutationStatus::kSyncing) {
    throw util::InvalidState("mutation " + record.id + ": not in flight");
  }
  Transition(record, MutationStatus::kPending, now_ms);
  record.error_message = error;
}

void ResetForRetry(db::model::MutationRecord& record, uint64_t now_ms) {
  if (record.status != MutationStatus::kFailed && record.status != MutationStatus::kConflict) {
    throw util::InvalidState("mutation " + record.id + " is " + std::string(model::StatusName(record.status)) + ", only failed or conflicting records can be retried");
  }
  Transition(record, MutationStatus::kPending, now_ms);
  record.retry_count = 0;
  record.error_message.clear();
  record.next_retry_at_ms.reset();
}

} // namespace millsync::sync
