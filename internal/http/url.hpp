#pragma once

#include <string>
#include <string_view>

#include "internal/http/http_client.hpp"

namespace twiper::http {

// RFC 3986 percent-encoding: keeps A-Z a-z 0-9 - . _ ~, encodes every other byte as %XX (uppercase).
std::string PercentEncode(std::string_view value);
std::string PercentDecode(std::string_view value);

// "k1=v1&k2=v2" with both sides percent-encoded, in the given order.
std::string EncodeParams(const Params& params);

// Appends "?<encoded query>" when query is non-empty.
std::string WithQuery(const std::string& url, const Params& query);

struct UrlParts {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;
};

// Throws std::invalid_argument for URLs without scheme://host.
UrlParts SplitUrl(const std::string& url);

// Decodes "a=b&c=d" into params (application/x-www-form-urlencoded; '+' is a space).
Params ParseQuery(std::string_view query);

} // namespace twiper::http
