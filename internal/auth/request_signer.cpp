#include "request_signer.hpp"

namespace twiper::auth {

void Authorize(RequestSigner& signer, http::HttpRequest* request) {
  request->headers.emplace_back("Authorization", signer.Sign(*request));
}

} // namespace twiper::auth
