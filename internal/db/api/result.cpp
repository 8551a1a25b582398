#include "result.hpp"

#include "internal/util/errors.hpp"

namespace millsync::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const std::string message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    default:
      throw util::StorageError(message);
  }
}

} // namespace millsync::db
