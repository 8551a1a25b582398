#pragma once

#include <cstdint>
#include <string_view>

namespace millsync::model {

enum class MutationStatus : std::uint8_t {
  kPending  = 0,
  kSyncing  = 1,
  kSynced   = 2,
  kFailed   = 3,
  kConflict = 4,
};

// Failed and Conflict only leave through an explicit reset.
constexpr bool IsTerminal(MutationStatus status) {
  return status == MutationStatus::kSynced || status == MutationStatus::kFailed || status == MutationStatus::kConflict;
}

constexpr bool IsOutstanding(MutationStatus status) {
  return status == MutationStatus::kPending || status == MutationStatus::kSyncing;
}

constexpr bool CanTransition(MutationStatus from, MutationStatus to) {
  if (from == to) {
    return from != MutationStatus::kSyncing;
  }

  switch (from) {
    case MutationStatus::kPending:
      return to == MutationStatus::kSyncing;
    case MutationStatus::kSyncing:
      return true;
    case MutationStatus::kFailed:
    case MutationStatus::kConflict:
      return to == MutationStatus::kPending;
    case MutationStatus::kSynced:
      return false;
  }
  return false;
}

constexpr std::string_view StatusName(MutationStatus status) {
  switch (status) {
    case MutationStatus::kPending:
      return "pending";
    case MutationStatus::kSyncing:
      return "syncing";
    case MutationStatus::kSynced:
      return "synced";
    case MutationStatus::kFailed:
      return "failed";
    case MutationStatus::kConflict:
      return "conflict";
  }
  return "unknown";
}

} // namespace millsync::model
