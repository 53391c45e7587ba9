#pragma once

#include <string>

#include "internal/auth/credentials.hpp"
#include "internal/auth/entropy_source.hpp"
#include "internal/auth/request_signer.hpp"
#include "internal/http/http_client.hpp"

namespace twiper::auth {

/*
  OAuth 1.0a HMAC-SHA1 request signer.

  Signed parameters are the URL query plus, for form-encoded bodies only,
  the form fields. Multipart and JSON bodies are never part of the
  signature base string.

  Construction fails with util::ConfigurationError if any credential is empty.
*/
class Oauth1Signer final : public RequestSigner {
 public:
  Oauth1Signer(Credentials credentials, EntropySourcePtr entropy);

  std::string Sign(const http::HttpRequest& request) override;

  // Header for an explicit method / URL / parameter set. A query string on
  // `url` is folded into the parameters.
  std::string AuthorizationHeader(const std::string& method, const std::string& url, const http::Params& params);

  // Exposed for verification against published test vectors.
  static std::string NormalizeUrl(const std::string& url);
  static std::string ParameterString(const http::Params& params);
  static std::string SignatureBaseString(const std::string& method, const std::string& url, const http::Params& params);
  static std::string HmacSha1Base64(const std::string& key, const std::string& message);

 private:
  std::string SigningKey() const;

  Credentials      credentials_;
  EntropySourcePtr entropy_;
};

} // namespace twiper::auth
