#include "endpoints.hpp"

#include "internal/remote/json_codec.hpp"
#include "internal/util/errors.hpp"

namespace millsync::remote {

using model::EntityType;
using model::MutationOperation;
using millsync::v1::MutationPayload;

namespace {

const std::string& RequireServerId(const db::model::MutationRecord& record) {
  if (!record.entity_server_id || record.entity_server_id->empty()) {
    throw util::InvalidState("mutation " + record.id + " has no server id for " + model::ToString(record.Entity()));
  }
  return *record.entity_server_id;
}

Request MovementRequest(const millsync::v1::StockMovement& movement) {
  Request request;
  request.method = HttpMethod::kPost;
  request.body   = ToJson(movement);

  if (movement.kind() == millsync::v1::MOVEMENT_KIND_ADJUSTMENT) {
    request.path = "/inventory/adjust";
  } else if (movement.quantity_delta() >= 0) {
    request.path = "/inventory/add-stock";
  } else {
    request.path = "/inventory/deduct-stock";
  }
  return request;
}

Request SnapshotRequest(const db::model::MutationRecord& record, const google::protobuf::Message& body) {
  Request request;
  request.body = ToJson(body);

  switch (record.operation) {
    case MutationOperation::kCreate:
      request.method = HttpMethod::kPost;
      request.path   = record.entity_type == EntityType::kMilling ? "/milling/create" : CollectionPath(record.entity_type);
      return request;
    case MutationOperation::kUpdate:
      request.method = HttpMethod::kPut;
      request.path   = CollectionPath(record.entity_type) + "/" + RequireServerId(record);
      return request;
    default:
      throw util::ValidationError("snapshot payload on a " + std::string(model::OperationName(record.operation)) + " record");
  }
}

} // namespace

std::string_view MethodName(HttpMethod method) {
  switch (method) {
    case HttpMethod::kGet:
      return "GET";
    case HttpMethod::kPost:
      return "POST";
    case HttpMethod::kPut:
      return "PUT";
    case HttpMethod::kPatch:
      return "PATCH";
    case HttpMethod::kDelete:
      return "DELETE";
  }
  return "GET";
}

std::string CollectionPath(EntityType type) {
  switch (type) {
    case EntityType::kCustomer:
      return "/customers";
    case EntityType::kInventory:
      return "/inventory";
    case EntityType::kTransaction:
      return "/transactions";
    case EntityType::kPayment:
      return "/payments";
    case EntityType::kMilling:
      return "/milling";
    case EntityType::kUser:
      return "/users";
    case EntityType::kUnspecified:
      break;
  }
  throw util::ValidationError("no endpoint for unspecified entity type");
}

bool SupportsBatch(EntityType type) {
  return type == EntityType::kCustomer || type == EntityType::kInventory || type == EntityType::kTransaction;
}

std::string BatchPath(EntityType type) {
  if (!SupportsBatch(type)) {
    throw util::ValidationError(std::string(model::EntityTypeName(type)) + " has no batch endpoint");
  }
  return CollectionPath(type) + "/batch";
}

std::string UpdatesPath(EntityType type, std::optional<uint64_t> since_ms) {
  return CollectionPath(type) + "/updates?since=" + std::to_string(since_ms.value_or(0));
}

Request BuildPushRequest(const db::model::MutationRecord& record, const MutationPayload& payload) {
  switch (payload.body_case()) {
    case MutationPayload::kCustomer:
      return SnapshotRequest(record, payload.customer());
    case MutationPayload::kInventory:
      return SnapshotRequest(record, payload.inventory());
    case MutationPayload::kTransaction:
      return SnapshotRequest(record, payload.transaction());
    case MutationPayload::kMilling:
      return SnapshotRequest(record, payload.milling());
    case MutationPayload::kUser:
      return SnapshotRequest(record, payload.user());

    case MutationPayload::kPayment: {
      if (record.operation != MutationOperation::kCreate) {
        throw util::ValidationError("payments can only be created");
      }
      const auto& payment = payload.payment();
      if (payment.transaction_server_id().empty()) {
        throw util::InvalidState("payment " + std::to_string(payment.local_id()) + " has no transaction server id");
      }
      return Request{HttpMethod::kPost, "/transactions/" + payment.transaction_server_id() + "/payments", ToJson(payment)};
    }

    case MutationPayload::kMovement:
      return MovementRequest(payload.movement());

    case MutationPayload::kTombstone:
      return Request{HttpMethod::kDelete, CollectionPath(record.entity_type) + "/" + RequireServerId(record), {}};

    case MutationPayload::BODY_NOT_SET:
      break;
  }
  throw util::ValidationError("mutation " + record.id + " carries no payload");
}

RemoteResult Send(RemoteApi& api, const Request& request, const util::CancelToken& cancel) {
  switch (request.method) {
    case HttpMethod::kGet:
      return api.Get(request.path, cancel);
    case HttpMethod::kPost:
      return api.Post(request.path, request.body, cancel);
    case HttpMethod::kPut:
      return api.Put(request.path, request.body, cancel);
    case HttpMethod::kPatch:
      return api.Patch(request.path, request.body, cancel);
    case HttpMethod::kDelete:
      return api.Delete(request.path, cancel);
  }
  return RemoteResult::Fail(util::Failure::Validation("unsupported method"));
}

} // namespace millsync::remote
