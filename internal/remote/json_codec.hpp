#pragma once

#include <string>

#include <google/protobuf/message.h>

namespace millsync::remote {

// Field names go out as declared in the .proto (snake_case), matching the server.
std::string ToJson(const google::protobuf::Message& message);

// Unknown fields are ignored. Throws util::ValidationError on malformed input.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace millsync::remote
