#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/mutation_record.hpp"

namespace millsync::sync {

/*
  State transitions of a MutationRecord. Every function validates the move
  with model::CanTransition and throws util::InvalidState when it is illegal.
  Persisting the record is the caller's job.
*/

void MarkSyncing(db::model::MutationRecord& record, uint64_t now_ms);

void MarkSynced(db::model::MutationRecord& record, uint64_t now_ms);

// Syncing -> Pending with backoff, or -> Failed once the retry budget is
// spent. Returns true when the record ended Failed.
bool MarkTransientFailure(db::model::MutationRecord& record, const std::string& error, uint64_t now_ms);

// Does not consume retry budget.
void MarkConflict(db::model::MutationRecord& record, const std::string& error, uint64_t now_ms);

// Syncing -> Pending without consuming retry budget or starting a backoff
// window (cancelled call, credentials rejected, record never sent).
void MarkReturned(db::model::MutationRecord& record, const std::string& error, uint64_t now_ms);

// Failed|Conflict -> Pending on explicit user action.
void ResetForRetry(db::model::MutationRecord& record, uint64_t now_ms);

} // namespace millsync::sync
