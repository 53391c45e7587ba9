#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace twiper::util {

bool ParseJson(const std::string& json, google::protobuf::Message* message, std::string* error) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    if (error) *error = status.ToString();
    return false;
  }
  return true;
}

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = pretty;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON: " + status.ToString());
  }
  return json;
}

} // namespace twiper::util
