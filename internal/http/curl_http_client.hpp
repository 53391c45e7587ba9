#pragma once

#include <cstdint>
#include <string>

#include "internal/http/http_client.hpp"

namespace twiper::http {

struct CurlOptions {
  std::uint32_t connect_timeout_ms = 60'000;
  std::uint32_t request_timeout_ms = 600'000;
  std::string   user_agent         = "twiper/1.0";
};

/*
  libcurl easy-interface transport.

  One easy handle per request; requests are strictly sequential so no
  handle reuse or multi interface is needed.
*/
class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(CurlOptions options);

  HttpResponse Send(const HttpRequest& request) override;

 private:
  CurlOptions options_;
};

} // namespace twiper::http
