#pragma once

#include <cstdint>
#include <string>

#include "millsync/v1/entities.pb.h"

namespace millsync::db::model {

// Append-only stock history row. id is assigned by the repository.
struct StockMovementRecord {
  int64_t id            = 0;
  int64_t item_local_id = 0;

  millsync::v1::MovementKind kind = millsync::v1::MOVEMENT_KIND_UNSPECIFIED;

  double  quantity_delta = 0;
  int32_t bags_delta     = 0;
  double  unit_price     = 0;

  std::string reference;
  std::string note;

  uint64_t recorded_at_ms = 0;
};

} // namespace millsync::db::model
