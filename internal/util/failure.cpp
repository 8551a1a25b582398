#include "failure.hpp"

#include "internal/util/errors.hpp"

namespace millsync::util {

std::string_view FailureKindName(FailureKind kind) {
  switch (kind) {
    case FailureKind::kNetwork:
      return "network";
    case FailureKind::kValidation:
      return "validation";
    case FailureKind::kAuth:
      return "auth";
    case FailureKind::kServer:
      return "server";
    case FailureKind::kSyncConflict:
      return "sync_conflict";
    case FailureKind::kNotFound:
      return "not_found";
    case FailureKind::kStorage:
      return "storage";
  }
  return "unknown";
}

Failure ToFailure(const std::exception& e) {
  if (dynamic_cast<const ValidationError*>(&e)) {
    return {FailureKind::kValidation, e.what(), 0};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {FailureKind::kNotFound, e.what(), 0};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {FailureKind::kValidation, e.what(), 0};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {FailureKind::kValidation, e.what(), 0};
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return {FailureKind::kStorage, e.what(), 0};
  }

  return {FailureKind::kServer, e.what(), 0};
}

} // namespace millsync::util
