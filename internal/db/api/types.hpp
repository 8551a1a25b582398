#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "internal/model/state_machine.hpp"
#include "internal/model/sync_types.hpp"

namespace millsync::db {

struct EntityFilter {
  // only entities whose sync_status is not Synced
  bool                    unsynced_only   = false;
  bool                    include_deleted = true;
  std::optional<uint64_t> updated_after_ms;
};

// Mutation listings are always ordered by sequence ascending.
struct MutationFilter {
  std::optional<millsync::model::MutationStatus> status;
  std::optional<millsync::model::EntityRef>      entity;
  std::optional<std::size_t>                     limit;
};

} // namespace millsync::db
