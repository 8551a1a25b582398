#include "internal/sync/mutation_lifecycle.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/model/state_machine.hpp"
#include "internal/sync/backoff.hpp"
#include "internal/util/errors.hpp"

namespace {

using millsync::db::model::MutationRecord;
using millsync::model::CanTransition;
using millsync::model::MutationStatus;
using namespace millsync::sync;
using namespace std::chrono_literals;

constexpr uint64_t kNow = 1'700'000'000'000ULL;

MutationRecord MakeRecord(uint32_t max_retries = 3) {
  MutationRecord record;
  record.id          = "mut-1";
  record.max_retries = max_retries;
  return record;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const millsync::util::InvalidState&) {
    return true;
  }
  return false;
}

void TestTransitionTable() {
  assert(CanTransition(MutationStatus::kPending, MutationStatus::kSyncing));
  assert(!CanTransition(MutationStatus::kPending, MutationStatus::kSynced));
  assert(!CanTransition(MutationStatus::kPending, MutationStatus::kFailed));

  assert(CanTransition(MutationStatus::kSyncing, MutationStatus::kSynced));
  assert(CanTransition(MutationStatus::kSyncing, MutationStatus::kPending));
  assert(CanTransition(MutationStatus::kSyncing, MutationStatus::kFailed));
  assert(CanTransition(MutationStatus::kSyncing, MutationStatus::kConflict));
  assert(!CanTransition(MutationStatus::kSyncing, MutationStatus::kSyncing));

  assert(CanTransition(MutationStatus::kFailed, MutationStatus::kPending));
  assert(!CanTransition(MutationStatus::kFailed, MutationStatus::kSyncing));
  assert(CanTransition(MutationStatus::kConflict, MutationStatus::kPending));
  assert(!CanTransition(MutationStatus::kConflict, MutationStatus::kSynced));

  assert(!CanTransition(MutationStatus::kSynced, MutationStatus::kPending));
  assert(!CanTransition(MutationStatus::kSynced, MutationStatus::kSyncing));
}

void TestSuccessfulAttempt() {
  auto record = MakeRecord();
  MarkSyncing(record, kNow);
  assert(record.status == MutationStatus::kSyncing);
  assert(record.last_attempt_at_ms == kNow);

  record.error_message = "stale";
  MarkSynced(record, kNow + 10);
  assert(record.status == MutationStatus::kSynced);
  assert(record.error_message.empty());
  assert(!record.next_retry_at_ms.has_value());
  assert(record.updated_at_ms == kNow + 10);

  assert(Throws([&] { MarkSyncing(record, kNow); }));
}

void TestTransientFailuresBackOffThenFail() {
  auto record = MakeRecord(3);

  MarkSyncing(record, kNow);
  assert(!MarkTransientFailure(record, "HTTP 503", kNow));
  assert(record.status == MutationStatus::kPending);
  assert(record.retry_count == 1);
  assert(record.error_message == "HTTP 503");
  assert(*record.next_retry_at_ms == kNow + 2 * 60 * 1000);

  MarkSyncing(record, kNow);
  assert(!MarkTransientFailure(record, "timeout", kNow));
  assert(record.retry_count == 2);
  assert(*record.next_retry_at_ms == kNow + 4 * 60 * 1000);

  MarkSyncing(record, kNow);
  assert(MarkTransientFailure(record, "timeout", kNow));
  assert(record.status == MutationStatus::kFailed);
  assert(record.retry_count == 3);
  assert(!record.next_retry_at_ms.has_value());
}

void TestConflictKeepsRetryBudget() {
  auto record = MakeRecord();
  MarkSyncing(record, kNow);
  MarkConflict(record, "HTTP 409: duplicate phone", kNow);
  assert(record.status == MutationStatus::kConflict);
  assert(record.retry_count == 0);
  assert(record.error_message == "HTTP 409: duplicate phone");

  assert(Throws([&] { MarkConflict(record, "again", kNow); }));
}

void TestReturnedRecordIsImmediatelyEligible() {
  auto record = MakeRecord();
  MarkSyncing(record, kNow);
  MarkReturned(record, "cancelled", kNow);
  assert(record.status == MutationStatus::kPending);
  assert(record.retry_count == 0);
  assert(!record.next_retry_at_ms.has_value());

  assert(Throws([&] { MarkReturned(record, "cancelled", kNow); }));
}

void TestResetOnlyFromFailedOrConflict() {
  auto record = MakeRecord(1);
  assert(Throws([&] { ResetForRetry(record, kNow); }));

  MarkSyncing(record, kNow);
  assert(MarkTransientFailure(record, "HTTP 500", kNow));
  ResetForRetry(record, kNow + 1);
  assert(record.status == MutationStatus::kPending);
  assert(record.retry_count == 0);
  assert(record.error_message.empty());

  MarkSyncing(record, kNow);
  MarkSynced(record, kNow);
  assert(Throws([&] { ResetForRetry(record, kNow); }));
}

void TestBackoffIsClampedAndMonotonic() {
  assert(BackoffDelay(0) == 1min);
  assert(BackoffDelay(1) == 2min);
  assert(BackoffDelay(3) == 8min);
  assert(BackoffDelay(5) == 32min);
  assert(BackoffDelay(6) == 60min);
  assert(BackoffDelay(1000) == 60min);

  for (uint32_t n = 0; n < 70; ++n) {
    assert(BackoffDelay(n) <= BackoffDelay(n + 1));
    assert(BackoffDelay(n) >= kMinBackoff && BackoffDelay(n) <= kMaxBackoff);
  }
}

} // namespace

int main() {
  TestTransitionTable();
  TestSuccessfulAttempt();
  TestTransientFailuresBackOffThenFail();
  TestConflictKeepsRetryBudget();
  TestReturnedRecordIsImmediatelyEligible();
  TestResetOnlyFromFailedOrConflict();
  TestBackoffIsClampedAndMonotonic();

  std::cout << "millsync_unit_mutation_lifecycle: pass\n";
  return 0;
}
