#include "access_token_provider.hpp"

#include <google/protobuf/struct.pb.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "twiper/api/v1/drive.pb.h"

namespace twiper::source::drive {

namespace {

constexpr std::int64_t kAssertionLifetimeSecs = 3600;

using BioPtr    = std::unique_ptr<BIO, decltype(&BIO_free)>;
using PKeyPtr   = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using MdCtxPtr  = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string EncodeSegment(const std::string& text) {
  return Base64UrlEncode(reinterpret_cast<const unsigned char*>(text.data()), text.size());
}

std::string SignRs256(const std::string& private_key_pem, const std::string& input) {
  BioPtr bio(BIO_new_mem_buf(private_key_pem.data(), static_cast<int>(private_key_pem.size())), &BIO_free);
  if (!bio) throw util::SourceError("BIO_new_mem_buf failed");

  PKeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
  if (!key) throw util::ConfigurationError("service account private_key is not a valid PEM key");

  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw util::SourceError("EVP_MD_CTX_new failed");

  if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1 ||
      EVP_DigestSignUpdate(ctx.get(), input.data(), input.size()) != 1) {
    throw util::SourceError("RS256 signing setup failed");
  }

  std::size_t length = 0;
  if (EVP_DigestSignFinal(ctx.get(), nullptr, &length) != 1) {
    throw util::SourceError("RS256 signature length failed");
  }
  std::vector<unsigned char> signature(length);
  if (EVP_DigestSignFinal(ctx.get(), signature.data(), &length) != 1) {
    throw util::SourceError("RS256 signing failed");
  }
  return Base64UrlEncode(signature.data(), length);
}

} // namespace

std::string Base64UrlEncode(const unsigned char* data, std::size_t size) {
  std::string out(4 * ((size + 2) / 3) + 1, '\0');
  const int   written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(size));
  out.resize(static_cast<std::size_t>(written));

  while (!out.empty() && out.back() == '=') out.pop_back();
  for (auto& c : out) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return out;
}

ServiceAccountTokenProvider::ServiceAccountTokenProvider(const std::string& key_json, http::HttpClientPtr http) : http_(std::move(http)) {
  if (!http_) {
    throw std::invalid_argument("ServiceAccountTokenProvider requires http client");
  }

  api::v1::ServiceAccountKey key;
  std::string                error;
  if (!util::ParseJson(key_json, &key, &error)) {
    throw util::ConfigurationError("invalid service account JSON: " + error);
  }
  if (key.client_email().empty() || key.private_key().empty()) {
    throw util::ConfigurationError("service account JSON lacks client_email or private_key");
  }

  client_email_    = key.client_email();
  private_key_pem_ = key.private_key();
  token_uri_       = key.token_uri().empty() ? kDefaultTokenUri : key.token_uri();
}

std::string ServiceAccountTokenProvider::BuildAssertion(util::TimePoint now) const {
  google::protobuf::Struct header;
  (*header.mutable_fields())["alg"].set_string_value("RS256");
  (*header.mutable_fields())["typ"].set_string_value("JWT");

  const auto issued = util::ToUnixSeconds(now);

  google::protobuf::Struct claims;
  auto&                    fields = *claims.mutable_fields();
  fields["iss"].set_string_value(client_email_);
  fields["scope"].set_string_value(kDriveScope);
  fields["aud"].set_string_value(token_uri_);
  fields["iat"].set_number_value(static_cast<double>(issued));
  fields["exp"].set_number_value(static_cast<double>(issued + kAssertionLifetimeSecs));

  const auto signing_input = EncodeSegment(util::ToJson(header)) + "." + EncodeSegment(util::ToJson(claims));
  return signing_input + "." + SignRs256(private_key_pem_, signing_input);
}

std::string ServiceAccountTokenProvider::AccessToken() {
  const auto now = util::Now();
  if (!token_.empty() && now + kRefreshMargin < expires_at_) {
    return token_;
  }

  http::HttpRequest request;
  request.method    = http::Method::kPost;
  request.url       = token_uri_;
  request.body_kind = http::BodyKind::kForm;
  request.form      = {
      {"grant_type", "urn:ietf:params:oauth:grant-type:jwt-bearer"},
      {"assertion", BuildAssertion(now)},
  };

  auto response = http_->Send(request);
  if (!response.Ok()) {
    throw util::SourceError("service account token exchange failed: " + http::Describe(response));
  }

  api::v1::TokenResponse token;
  std::string            error;
  if (!util::ParseJson(response.body, &token, &error) || token.access_token().empty()) {
    throw util::SourceError("malformed token response: " + (error.empty() ? http::Describe(response) : error));
  }

  token_      = token.access_token();
  expires_at_ = now + std::chrono::seconds(token.expires_in() > 0 ? token.expires_in() : kAssertionLifetimeSecs);
  TWIPER_LOG_DEBUG("drive access token refreshed",
                   {observability::StringField("client_email", client_email_), observability::IntField("expires_in", token.expires_in())});
  return token_;
}

} // namespace twiper::source::drive
