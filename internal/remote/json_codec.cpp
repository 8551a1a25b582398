#include "json_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace millsync::remote {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw util::ValidationError("failed to encode " + message.GetTypeName() + ": " + status.ToString());
  }
  return out;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::ValidationError("malformed " + message->GetTypeName() + " response: " + status.ToString());
  }
}

} // namespace millsync::remote
