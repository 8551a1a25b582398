#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/mutation_record.hpp"
#include "internal/remote/remote_api.hpp"

namespace millsync::remote {

enum class HttpMethod { kGet, kPost, kPut, kPatch, kDelete };

std::string_view MethodName(HttpMethod method);

struct Request {
  HttpMethod  method = HttpMethod::kGet;
  std::string path;
  std::string body;
};

// "/customers", "/inventory", ...
std::string CollectionPath(model::EntityType type);

// Customer, inventory and transaction creates can travel through "<collection>/batch".
bool SupportsBatch(model::EntityType type);

std::string BatchPath(model::EntityType type);

std::string UpdatesPath(model::EntityType type, std::optional<uint64_t> since_ms);

/*
  Maps a queued record onto the server API. `payload` is the record's body
  with every server id already resolved; Update and Delete also need
  record.entity_server_id. Throws util::ValidationError for a record the API
  cannot express.
*/
Request BuildPushRequest(const db::model::MutationRecord& record, const millsync::v1::MutationPayload& payload);

RemoteResult Send(RemoteApi& api, const Request& request, const util::CancelToken& cancel);

} // namespace millsync::remote
