#include "failure_classifier.hpp"

namespace millsync::sync {

using model::MutationOperation;
using util::FailureKind;

std::string_view ClassificationName(Classification c) {
  switch (c) {
    case Classification::kSuccess:
      return "success";
    case Classification::kTransientFailure:
      return "transient";
    case Classification::kSemanticConflict:
      return "conflict";
    case Classification::kAuthRequired:
      return "auth_required";
    case Classification::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

Classification ClassifyStatus(int status_code, MutationOperation operation) {
  if (status_code >= 200 && status_code < 300) {
    return Classification::kSuccess;
  }

  switch (status_code) {
    case 0:
    case 408:
    case 429:
      return Classification::kTransientFailure;
    case 401:
    case 403:
      return Classification::kAuthRequired;
    case 404:
      // the server no longer has it, which is what a delete wanted
      return operation == MutationOperation::kDelete ? Classification::kSuccess : Classification::kSemanticConflict;
    default:
      break;
  }

  if (status_code >= 500) {
    return Classification::kTransientFailure;
  }
  if (status_code >= 400) {
    return Classification::kSemanticConflict;
  }

  // 1xx/3xx never reach us from a well-behaved transport; retry rather than drop
  return Classification::kTransientFailure;
}

Classification Classify(const remote::RemoteResult& result, MutationOperation operation, const util::CancelToken& cancel) {
  // a reply that arrived is honoured even after cancel; the server has acted on it
  if (!result && cancel.IsCancelled()) {
    return Classification::kCancelled;
  }

  if (result) {
    const auto& response = result.value();
    if (response.status_code == 0) {
      return response.success ? Classification::kSuccess : Classification::kTransientFailure;
    }
    const bool ok_status = response.status_code >= 200 && response.status_code < 300;
    if (ok_status && !response.success) {
      return Classification::kTransientFailure;
    }
    return ClassifyStatus(response.status_code, operation);
  }

  const auto& failure = result.failure();
  switch (failure.kind) {
    case FailureKind::kAuth:
      return Classification::kAuthRequired;
    case FailureKind::kNetwork:
      return Classification::kTransientFailure;
    case FailureKind::kValidation:
    case FailureKind::kSyncConflict:
      return Classification::kSemanticConflict;
    case FailureKind::kNotFound:
      return operation == MutationOperation::kDelete ? Classification::kSuccess : Classification::kSemanticConflict;
    case FailureKind::kServer:
    case FailureKind::kStorage:
      break;
  }
  return failure.status_code > 0 ? ClassifyStatus(failure.status_code, operation) : Classification::kTransientFailure;
}

std::string DescribeResult(const remote::RemoteResult& result) {
  if (result) {
    const auto& response = result.value();
    std::string text     = "HTTP " + std::to_string(response.status_code);
    if (!response.message.empty()) text += ": " + response.message;
    return text;
  }

  const auto& failure = result.failure();
  std::string text    = std::string(util::FailureKindName(failure.kind));
  if (failure.status_code > 0) text += " " + std::to_string(failure.status_code);
  return text + ": " + failure.message;
}

} // namespace millsync::sync
