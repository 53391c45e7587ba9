#pragma once

#include <string>
#include <vector>

#include "internal/auth/request_signer.hpp"
#include "internal/http/http_client.hpp"

namespace twiper::post {

/*
  Creates posts through the v2 posting endpoint.

  The JSON body is not part of the OAuth signature; only the URL is signed.
*/
class PostClient {
 public:
  static constexpr const char* kDefaultEndpoint = "https://api.twitter.com/2/tweets";

  PostClient(http::HttpClientPtr http, auth::RequestSignerPtr signer, std::string endpoint = kDefaultEndpoint);

  /*
    Returns the id of the created post.

    Throws TransientNetworkError when no HTTP status was received and
    ProtocolError for a non-2xx status or a reply without data.id.
  */
  std::string CreatePost(const std::string& text, const std::vector<std::string>& media_ids);

  // JSON body for CreatePost; empty text and media are omitted.
  static std::string BuildBody(const std::string& text, const std::vector<std::string>& media_ids);

 private:
  http::HttpClientPtr    http_;
  auth::RequestSignerPtr signer_;
  std::string            endpoint_;
};

} // namespace twiper::post
