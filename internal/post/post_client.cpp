#include "post_client.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "twiper/api/v1/media.pb.h"

namespace twiper::post {

PostClient::PostClient(http::HttpClientPtr http, auth::RequestSignerPtr signer, std::string endpoint)
    : http_(std::move(http)), signer_(std::move(signer)), endpoint_(std::move(endpoint)) {
  if (!http_ || !signer_) {
    throw std::invalid_argument("PostClient requires http client and signer");
  }
}

std::string PostClient::BuildBody(const std::string& text, const std::vector<std::string>& media_ids) {
  api::v1::CreatePostRequest request;
  if (!text.empty()) request.set_text(text);
  for (const auto& id : media_ids) {
    request.mutable_media()->add_media_ids(id);
  }
  return util::ToJson(request);
}

std::string PostClient::CreatePost(const std::string& text, const std::vector<std::string>& media_ids) {
  http::HttpRequest request;
  request.method    = http::Method::kPost;
  request.url       = endpoint_;
  request.body_kind = http::BodyKind::kJson;
  request.body      = BuildBody(text, media_ids);
  auth::Authorize(*signer_, &request);

  auto response = http_->Send(request);
  if (response.TransportFailed()) {
    throw util::TransientNetworkError("create post: " + http::Describe(response));
  }
  if (!response.Ok()) {
    throw util::ProtocolError("create post rejected: " + http::Describe(response));
  }

  api::v1::CreatePostResponse reply;
  std::string                 error;
  if (!util::ParseJson(response.body, &reply, &error)) {
    throw util::ProtocolError("malformed create post response: " + error);
  }
  if (reply.data().id().empty()) {
    throw util::ProtocolError("create post response without data.id: " + http::Describe(response));
  }

  TWIPER_LOG_INFO("post created", {observability::StringField("post_id", reply.data().id()),
                                   observability::IntField("media", static_cast<std::int64_t>(media_ids.size()))});
  return reply.data().id();
}

} // namespace twiper::post
