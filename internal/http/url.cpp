#include "url.hpp"

#include <cctype>
#include <stdexcept>

namespace twiper::http {

namespace {

bool IsUnreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string Lower(std::string value) {
  for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return value;
}

} // namespace

std::string PercentEncode(std::string_view value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  out.reserve(value.size() * 3);
  for (char ch : value) {
    const auto c = static_cast<unsigned char>(ch);
    if (IsUnreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[(c >> 4) & 0x0F]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string PercentDecode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      const int hi = HexValue(value[i + 1]);
      const int lo = HexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(value[i] == '+' ? ' ' : value[i]);
  }
  return out;
}

std::string EncodeParams(const Params& params) {
  std::string out;
  for (const auto& [key, value] : params) {
    if (!out.empty()) out.push_back('&');
    out += PercentEncode(key);
    out.push_back('=');
    out += PercentEncode(value);
  }
  return out;
}

std::string WithQuery(const std::string& url, const Params& query) {
  if (query.empty()) {
    return url;
  }
  return url + (url.find('?') == std::string::npos ? "?" : "&") + EncodeParams(query);
}

UrlParts SplitUrl(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw std::invalid_argument("URL has no scheme: " + url);
  }

  UrlParts parts;
  parts.scheme = Lower(url.substr(0, scheme_end));

  const auto authority_begin = scheme_end + 3;
  auto       authority_end   = url.find_first_of("/?#", authority_begin);
  if (authority_end == std::string::npos) authority_end = url.size();
  std::string authority = url.substr(authority_begin, authority_end - authority_begin);
  if (authority.empty()) {
    throw std::invalid_argument("URL has no host: " + url);
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    parts.port = authority.substr(colon + 1);
    authority.resize(colon);
  }
  parts.host = Lower(authority);

  auto rest = url.substr(authority_end);
  if (const auto hash = rest.find('#'); hash != std::string::npos) {
    rest.resize(hash);
  }
  if (const auto q = rest.find('?'); q != std::string::npos) {
    parts.query = rest.substr(q + 1);
    rest.resize(q);
  }
  parts.path = rest.empty() ? "/" : rest;
  return parts;
}

Params ParseQuery(std::string_view query) {
  Params params;
  while (!query.empty()) {
    const auto amp  = query.find('&');
    const auto pair = query.substr(0, amp);
    if (!pair.empty()) {
      const auto eq = pair.find('=');
      if (eq == std::string_view::npos) {
        params.emplace_back(PercentDecode(pair), "");
      } else {
        params.emplace_back(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)));
      }
    }
    if (amp == std::string_view::npos) break;
    query.remove_prefix(amp + 1);
  }
  return params;
}

} // namespace twiper::http
