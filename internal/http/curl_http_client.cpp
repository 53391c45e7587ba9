#include "curl_http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>

#include "internal/http/url.hpp"

namespace twiper::http {

namespace {

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using MimeHandle = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;

void EnsureGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

void AppendHeader(HeaderList& list, const std::string& line) {
  curl_slist* next = curl_slist_append(list.get(), line.c_str());
  if (!next) {
    throw std::runtime_error("curl_slist_append failed");
  }
  list.release();
  list.reset(next);
}

} // namespace

CurlHttpClient::CurlHttpClient(CurlOptions options) : options_(std::move(options)) {
  EnsureGlobalInit();
}

HttpResponse CurlHttpClient::Send(const HttpRequest& request) {
  HttpResponse response;

  EasyHandle handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    response.transport_error = "curl_easy_init failed";
    return response;
  }
  CURL* curl = handle.get();

  const std::string url = WithQuery(request.url, request.query);
  char              error_buffer[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_ms));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout_ms));
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &WriteBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

  HeaderList headers(nullptr, &curl_slist_free_all);
  MimeHandle mime(nullptr, &curl_mime_free);
  std::string form_body;

  for (const auto& [name, value] : request.headers) {
    AppendHeader(headers, name + ": " + value);
  }

  switch (request.body_kind) {
    case BodyKind::kNone:
      break;
    case BodyKind::kForm:
      form_body = EncodeParams(request.form);
      AppendHeader(headers, "Content-Type: application/x-www-form-urlencoded");
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, form_body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(form_body.size()));
      break;
    case BodyKind::kJson:
      AppendHeader(headers, "Content-Type: application/json");
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
      break;
    case BodyKind::kMultipart: {
      mime.reset(curl_mime_init(curl));
      for (const auto& part : request.parts) {
        curl_mimepart* mime_part = curl_mime_addpart(mime.get());
        curl_mime_name(mime_part, part.name.c_str());
        if (part.data) {
          curl_mime_data(mime_part, reinterpret_cast<const char*>(part.data->data()), static_cast<size_t>(part.data->size()));
        } else {
          curl_mime_data(mime_part, part.value.c_str(), CURL_ZERO_TERMINATED);
        }
        if (!part.filename.empty()) curl_mime_filename(mime_part, part.filename.c_str());
        if (!part.content_type.empty()) curl_mime_type(mime_part, part.content_type.c_str());
      }
      curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime.get());
      break;
    }
  }

  switch (request.method) {
    case Method::kGet:
      curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
      break;
    case Method::kPost:
      // POSTFIELDS / MIMEPOST already select POST; CURLOPT_POST would override MIMEPOST.
      if (request.body_kind == BodyKind::kNone) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
      }
      break;
    case Method::kPatch:
    case Method::kDelete:
      curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, MethodName(request.method));
      break;
  }

  if (headers) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  }

  const CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    response.transport_error = error_buffer[0] ? std::string(error_buffer) : std::string(curl_easy_strerror(rc));
    return response;
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

} // namespace twiper::http
