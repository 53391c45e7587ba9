#pragma once

#include <google/protobuf/message.h>

#include <string>

namespace twiper::util {

/*
  JSON <-> protobuf helpers for REST payloads.

  Parsing ignores unknown fields: remote APIs add fields freely and only
  the declared subset is consumed.
*/
bool ParseJson(const std::string& json, google::protobuf::Message* message, std::string* error);

std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

} // namespace twiper::util
