#include "sync_types.hpp"

namespace millsync::model {

std::string_view EntityTypeName(EntityType type) {
  switch (type) {
    case EntityType::kCustomer:
      return "customer";
    case EntityType::kInventory:
      return "inventory";
    case EntityType::kTransaction:
      return "transaction";
    case EntityType::kPayment:
      return "payment";
    case EntityType::kMilling:
      return "milling";
    case EntityType::kUser:
      return "user";
    case EntityType::kUnspecified:
      break;
  }
  return "unspecified";
}

std::string_view OperationName(MutationOperation op) {
  switch (op) {
    case MutationOperation::kCreate:
      return "create";
    case MutationOperation::kUpdate:
      return "update";
    case MutationOperation::kDelete:
      return "delete";
    case MutationOperation::kUnspecified:
      break;
  }
  return "unspecified";
}

std::string_view PriorityName(MutationPriority priority) {
  switch (priority) {
    case MutationPriority::kLow:
      return "low";
    case MutationPriority::kNormal:
      return "normal";
    case MutationPriority::kHigh:
      return "high";
    case MutationPriority::kCritical:
      return "critical";
  }
  return "normal";
}

std::optional<EntityType> ParseEntityType(std::string_view name) {
  for (auto type : {EntityType::kCustomer, EntityType::kInventory, EntityType::kTransaction, EntityType::kPayment, EntityType::kMilling,
                    EntityType::kUser}) {
    if (EntityTypeName(type) == name) {
      return type;
    }
  }
  return std::nullopt;
}

std::string ToString(const EntityRef& ref) {
  return std::string(EntityTypeName(ref.type)) + "#" + std::to_string(ref.local_id);
}

} // namespace millsync::model
