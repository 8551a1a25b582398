#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace millsync::model {

enum class EntityType : std::uint8_t {
  kUnspecified = 0,
  kCustomer    = 1,
  kInventory   = 2,
  kTransaction = 3,
  kPayment     = 4,
  kMilling     = 5,
  kUser        = 6,
};

enum class MutationOperation : std::uint8_t {
  kUnspecified = 0,
  kCreate      = 1,
  kUpdate      = 2,
  kDelete      = 3,
};

// Drain order only; never affects per-entity ordering.
enum class MutationPriority : std::uint8_t {
  kLow      = 0,
  kNormal   = 1,
  kHigh     = 2,
  kCritical = 3,
};

struct EntityRef {
  EntityType type     = EntityType::kUnspecified;
  int64_t    local_id = 0;

  bool operator==(const EntityRef&) const = default;
  auto operator<=>(const EntityRef&) const = default;
};

std::string_view EntityTypeName(EntityType type);
std::string_view OperationName(MutationOperation op);
std::string_view PriorityName(MutationPriority priority);

std::optional<EntityType> ParseEntityType(std::string_view name);

std::string ToString(const EntityRef& ref);

} // namespace millsync::model
