#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/http/http_client.hpp"
#include "internal/util/time.hpp"

namespace twiper::source::drive {

class AccessTokenProvider {
 public:
  virtual ~AccessTokenProvider() = default;

  // Bearer token valid for at least the next request. Throws SourceError.
  virtual std::string AccessToken() = 0;
};

using AccessTokenProviderPtr = std::shared_ptr<AccessTokenProvider>;

/*
  OAuth2 service-account flow (RFC 7523 JWT bearer grant).

  An RS256-signed assertion for the service account is exchanged at the
  key's token_uri. The token is cached until 60 s before it expires.
*/
class ServiceAccountTokenProvider final : public AccessTokenProvider {
 public:
  static constexpr const char* kDriveScope       = "https://www.googleapis.com/auth/drive";
  static constexpr const char* kDefaultTokenUri  = "https://oauth2.googleapis.com/token";
  static constexpr std::chrono::seconds kRefreshMargin{60};

  // `key_json` is the downloaded service account key file. Throws ConfigurationError.
  ServiceAccountTokenProvider(const std::string& key_json, http::HttpClientPtr http);

  std::string AccessToken() override;

  const std::string& ClientEmail() const {
    return client_email_;
  }

  // Signed "<header>.<claims>.<signature>" assertion for `now`.
  std::string BuildAssertion(util::TimePoint now) const;

 private:
  http::HttpClientPtr http_;
  std::string         client_email_;
  std::string         private_key_pem_;
  std::string         token_uri_;

  std::string     token_;
  util::TimePoint expires_at_{};
};

// URL-safe base64 without padding (RFC 7515 appendix C).
std::string Base64UrlEncode(const unsigned char* data, std::size_t size);

} // namespace twiper::source::drive
