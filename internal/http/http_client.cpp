#include "http_client.hpp"

namespace twiper::http {

const char* MethodName(Method method) {
  switch (method) {
    case Method::kGet:
      return "GET";
    case Method::kPost:
      return "POST";
    case Method::kPatch:
      return "PATCH";
    case Method::kDelete:
      return "DELETE";
  }
  return "GET";
}

std::string Describe(const HttpResponse& response) {
  if (response.TransportFailed()) {
    return "transport error: " + response.transport_error;
  }
  constexpr std::size_t kMaxBody = 512;
  std::string           body     = response.body.substr(0, kMaxBody);
  if (response.body.size() > kMaxBody) body += "...";
  return "HTTP " + std::to_string(response.status_code) + (body.empty() ? "" : " " + body);
}

} // namespace twiper::http
