#pragma once

#include <string>
#include <string_view>

#include "internal/model/sync_types.hpp"
#include "internal/remote/remote_api.hpp"

namespace millsync::sync {

enum class Classification {
  kSuccess,
  kTransientFailure,
  kSemanticConflict,
  // credentials rejected; the record goes back untouched and the pass stops
  kAuthRequired,
  kCancelled,
};

std::string_view ClassificationName(Classification c);

// Classifies an answered request by its HTTP status.
Classification ClassifyStatus(int status_code, model::MutationOperation operation);

// Classifies a transport result. A tripped token wins over whatever the call returned.
Classification Classify(const remote::RemoteResult& result, model::MutationOperation operation, const util::CancelToken& cancel);

// Human-readable reason recorded on the mutation record.
std::string DescribeResult(const remote::RemoteResult& result);

} // namespace millsync::sync
