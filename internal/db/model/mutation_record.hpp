#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/model/sync_types.hpp"
#include "millsync/v1/mutation.pb.h"

namespace millsync::db::model {

/*
  Durable pending change to one entity.

  sequence is assigned at enqueue and breaks createdAt ties. depends_on lists
  the parents whose server ids must be known before the record can be sent.
*/

struct MutationRecord {
  std::string id;
  uint64_t    sequence = 0;

  millsync::model::EntityType entity_type = millsync::model::EntityType::kUnspecified;
  int64_t                     entity_id   = 0;
  std::optional<std::string>  entity_server_id;

  millsync::model::MutationOperation operation = millsync::model::MutationOperation::kUnspecified;
  millsync::model::MutationStatus    status    = millsync::model::MutationStatus::kPending;
  millsync::model::MutationPriority  priority  = millsync::model::MutationPriority::kNormal;

  millsync::v1::MutationPayload           payload;
  std::vector<millsync::model::EntityRef> depends_on;

  std::string error_message;
  uint32_t    retry_count = 0;
  uint32_t    max_retries = 3;

  std::optional<uint64_t> last_attempt_at_ms;
  std::optional<uint64_t> next_retry_at_ms;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  millsync::model::EntityRef Entity() const {
    return {entity_type, entity_id};
  }
};

} // namespace millsync::db::model
