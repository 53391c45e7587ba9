#include "oauth1_signer.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

#include "internal/http/url.hpp"
#include "internal/util/errors.hpp"

namespace twiper::auth {

using http::Params;
using http::PercentEncode;

Oauth1Signer::Oauth1Signer(Credentials credentials, EntropySourcePtr entropy)
    : credentials_(std::move(credentials)), entropy_(std::move(entropy)) {
  std::vector<std::string> missing;
  if (credentials_.consumer_key.empty()) missing.emplace_back("consumer key");
  if (credentials_.consumer_secret.empty()) missing.emplace_back("consumer secret");
  if (credentials_.access_token.empty()) missing.emplace_back("access token");
  if (credentials_.access_secret.empty()) missing.emplace_back("access secret");
  if (!missing.empty()) {
    std::string joined;
    for (const auto& m : missing) joined += (joined.empty() ? "" : ", ") + m;
    throw util::ConfigurationError("OAuth signer is missing credentials: " + joined);
  }
  if (!entropy_) {
    throw util::ConfigurationError("OAuth signer requires an entropy source");
  }
}

std::string Oauth1Signer::Sign(const http::HttpRequest& request) {
  Params params = request.query;
  if (request.body_kind == http::BodyKind::kForm) {
    params.insert(params.end(), request.form.begin(), request.form.end());
  }
  return AuthorizationHeader(http::MethodName(request.method), request.url, params);
}

std::string Oauth1Signer::AuthorizationHeader(const std::string& method, const std::string& url, const Params& params) {
  Params oauth = {
      {"oauth_consumer_key", credentials_.consumer_key},
      {"oauth_nonce", entropy_->NextNonce()},
      {"oauth_signature_method", "HMAC-SHA1"},
      {"oauth_timestamp", std::to_string(entropy_->NowUnixSeconds())},
      {"oauth_token", credentials_.access_token},
      {"oauth_version", "1.0"},
  };

  Params all = params;
  all.insert(all.end(), oauth.begin(), oauth.end());

  oauth.emplace_back("oauth_signature", HmacSha1Base64(SigningKey(), SignatureBaseString(method, url, all)));
  std::sort(oauth.begin(), oauth.end());

  std::string header = "OAuth ";
  for (std::size_t i = 0; i < oauth.size(); ++i) {
    if (i) header += ", ";
    header += PercentEncode(oauth[i].first) + "=\"" + PercentEncode(oauth[i].second) + "\"";
  }
  return header;
}

std::string Oauth1Signer::NormalizeUrl(const std::string& url) {
  const auto parts = http::SplitUrl(url);
  std::string base = parts.scheme + "://" + parts.host;
  const bool  default_port =
      parts.port.empty() || (parts.scheme == "http" && parts.port == "80") || (parts.scheme == "https" && parts.port == "443");
  if (!default_port) {
    base += ":" + parts.port;
  }
  return base + parts.path;
}

std::string Oauth1Signer::ParameterString(const Params& params) {
  std::vector<std::pair<std::string, std::string>> encoded;
  encoded.reserve(params.size());
  for (const auto& [key, value] : params) {
    encoded.emplace_back(PercentEncode(key), PercentEncode(value));
  }
  std::sort(encoded.begin(), encoded.end());

  std::string out;
  for (const auto& [key, value] : encoded) {
    if (!out.empty()) out.push_back('&');
    out += key + "=" + value;
  }
  return out;
}

std::string Oauth1Signer::SignatureBaseString(const std::string& method, const std::string& url, const Params& params) {
  Params all = params;
  const auto parts = http::SplitUrl(url);
  if (!parts.query.empty()) {
    auto query = http::ParseQuery(parts.query);
    all.insert(all.end(), query.begin(), query.end());
  }

  std::string upper_method = method;
  std::transform(upper_method.begin(), upper_method.end(), upper_method.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  return upper_method + "&" + PercentEncode(NormalizeUrl(url)) + "&" + PercentEncode(ParameterString(all));
}

std::string Oauth1Signer::HmacSha1Base64(const std::string& key, const std::string& message) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(message.data()), message.size(), digest,
            &digest_len)) {
    throw std::runtime_error("HMAC-SHA1 failed");
  }

  // 4 * ceil(n / 3) characters plus the terminating NUL written by EVP_EncodeBlock.
  std::string encoded(4 * ((digest_len + 2) / 3) + 1, '\0');
  const int   written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()), digest, static_cast<int>(digest_len));
  encoded.resize(static_cast<std::size_t>(written));
  return encoded;
}

std::string Oauth1Signer::SigningKey() const {
  return PercentEncode(credentials_.consumer_secret) + "&" + PercentEncode(credentials_.access_secret);
}

} // namespace twiper::auth
