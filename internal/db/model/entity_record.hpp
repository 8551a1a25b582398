#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/model/sync_types.hpp"

namespace millsync::db::model {

/*
  Entity Ledger row.

  The typed body travels as serialized protobuf; the columns next to it are
  what the sync engine reads and writes. local_id is allocated on the device
  and never changes; server_id is filled exactly once.
*/

struct EntityRecord {
  millsync::model::EntityType type     = millsync::model::EntityType::kUnspecified;
  int64_t                     local_id = 0;
  std::optional<std::string>  server_id;

  // mirrors the outcome of the entity's latest mutation
  millsync::model::MutationStatus sync_status = millsync::model::MutationStatus::kPending;

  bool is_deleted = false;

  // customer phone, inventory type:variety, transaction number
  std::string natural_key;

  std::string body;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  bool IsSynced() const {
    return sync_status == millsync::model::MutationStatus::kSynced;
  }

  millsync::model::EntityRef Ref() const {
    return {type, local_id};
  }
};

} // namespace millsync::db::model
