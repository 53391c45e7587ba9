#pragma once

#include <memory>
#include <string>

#include "internal/http/http_client.hpp"

namespace twiper::auth {

/*
  Produces the Authorization header value for a request.
*/
class RequestSigner {
 public:
  virtual ~RequestSigner() = default;

  virtual std::string Sign(const http::HttpRequest& request) = 0;
};

using RequestSignerPtr = std::shared_ptr<RequestSigner>;

// Adds "Authorization: <signer.Sign(request)>" to the request headers.
void Authorize(RequestSigner& signer, http::HttpRequest* request);

} // namespace twiper::auth
