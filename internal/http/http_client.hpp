#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace twiper::http {

using Params = std::vector<std::pair<std::string, std::string>>;

enum class Method { kGet, kPost, kPatch, kDelete };

enum class BodyKind {
  kNone,
  kForm,       // application/x-www-form-urlencoded, participates in OAuth signing
  kMultipart,  // multipart/form-data, never signed
  kJson,       // application/json, never signed
};

struct MultipartPart {
  std::string                    name;
  std::string                    value;         // text part
  std::shared_ptr<arrow::Buffer> data;          // binary part when set
  std::string                    filename;
  std::string                    content_type;
};

struct HttpRequest {
  Method      method = Method::kGet;
  std::string url;  // scheme://host/path, no query
  Params      query;
  BodyKind    body_kind = BodyKind::kNone;
  Params      form;
  std::vector<MultipartPart> parts;
  std::string body;  // kJson
  Params      headers;
};

struct HttpResponse {
  long        status_code = 0;
  std::string body;
  // Non-empty when the request never produced an HTTP status (DNS, connect, timeout, TLS).
  std::string transport_error;

  bool TransportFailed() const {
    return !transport_error.empty();
  }

  bool Ok() const {
    return !TransportFailed() && status_code >= 200 && status_code < 300;
  }

  // Worth retrying: network failure, 5xx or rate limiting.
  bool Transient() const {
    return TransportFailed() || status_code >= 500 || status_code == 429;
  }
};

/*
  Blocking HTTP transport.

  Implementations never throw for HTTP-level failures; a failed exchange is
  reported through HttpResponse so callers decide what is transient.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Send(const HttpRequest& request) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

const char* MethodName(Method method);

// Short description for logs and error messages: "503 <body prefix>" or the transport error.
std::string Describe(const HttpResponse& response);

} // namespace twiper::http
