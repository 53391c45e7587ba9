#include "chunked_uploader.hpp"

#include <stdexcept>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/upload/chunking.hpp"
#include "internal/util/json.hpp"
#include "internal/util/random.hpp"
#include "twiper/api/v1/media.pb.h"

namespace twiper::upload {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kStatePending    = "pending";
constexpr const char* kStateInProgress = "in_progress";
constexpr const char* kStateSucceeded  = "succeeded";
constexpr const char* kStateFailed     = "failed";

std::string RemoteErrorMessage(const api::v1::ProcessingInfo& info) {
  if (!info.has_error()) return "media processing failed";
  const auto& error = info.error();
  if (!error.message().empty()) return error.message();
  if (!error.name().empty()) return error.name();
  return "media processing failed (code " + std::to_string(error.code()) + ")";
}

} // namespace

UploadOptions UploadOptions::FromConfig(const twiper::runtime::config::UploadConfig& config) {
  UploadOptions options;
  if (!config.endpoint().empty()) options.endpoint = config.endpoint();
  if (config.chunk_size_bytes() != 0) options.chunk_size_bytes = config.chunk_size_bytes();
  if (config.max_append_attempts() != 0) options.max_append_attempts = config.max_append_attempts();
  if (config.backoff_base_ms() != 0) options.retry.base = std::chrono::milliseconds(config.backoff_base_ms());
  if (config.backoff_cap_ms() != 0) options.retry.cap = std::chrono::milliseconds(config.backoff_cap_ms());
  if (config.default_status_interval_secs() != 0) {
    options.default_status_interval = std::chrono::seconds(config.default_status_interval_secs());
  }
  if (config.max_processing_wait_secs() != 0) {
    options.max_processing_wait = std::chrono::seconds(config.max_processing_wait_secs());
  }
  return options;
}

ChunkedUploader::ChunkedUploader(http::HttpClientPtr http, auth::RequestSignerPtr signer, UploadOptions options, SleeperPtr sleeper)
    : http_(std::move(http)), signer_(std::move(signer)), options_(std::move(options)), sleeper_(std::move(sleeper)) {
  if (!http_ || !signer_ || !sleeper_) {
    throw std::invalid_argument("ChunkedUploader requires http client, signer and sleeper");
  }
  if (options_.chunk_size_bytes == 0) {
    throw util::ConfigurationError("upload chunk size must be positive");
  }
  if (options_.max_append_attempts == 0) {
    throw util::ConfigurationError("upload max_append_attempts must be positive");
  }
}

UploadResult ChunkedUploader::Upload(const std::shared_ptr<arrow::Buffer>& bytes, const MediaDescriptor& media) {
  UploadResult result;
  auto&        session = result.session;
  session.total_bytes  = bytes ? static_cast<std::uint64_t>(bytes->size()) : 0;
  check_after_secs_    = 0;

  if (session.total_bytes == 0) {
    Fail(session, FailureReason::kInitRejected, "empty media payload");
    return result;
  }

  Init(session, media);
  if (session.state == UploadState::kFailed) return result;

  AppendAll(session, bytes, media);
  if (session.state == UploadState::kFailed) return result;

  Finalize(session);
  if (session.state == UploadState::kProcessing) {
    PollStatus(session);
  }

  if (session.Succeeded()) {
    TWIPER_LOG_INFO("media upload succeeded",
                    {StringField("media_id", session.media_id), StringField("file", media.filename),
                     IntField("bytes", static_cast<std::int64_t>(session.total_bytes))});
  }
  return result;
}

std::string ChunkedUploader::UploadOrThrow(const std::shared_ptr<arrow::Buffer>& bytes, const MediaDescriptor& media) {
  auto result = Upload(bytes, media);
  if (!result.Succeeded()) {
    throw UploadError(result.session.failure_reason, result.session.failure_message);
  }
  return result.session.media_id;
}

void ChunkedUploader::Init(UploadSession& session, const MediaDescriptor& media) {
  http::HttpRequest request;
  request.method    = http::Method::kPost;
  request.url       = options_.endpoint;
  request.body_kind = http::BodyKind::kForm;
  request.form      = {
      {"command", "INIT"},
      {"total_bytes", std::to_string(session.total_bytes)},
      {"media_type", media.media_type},
  };
  if (!media.media_category.empty()) {
    request.form.emplace_back("media_category", media.media_category);
  }

  auto response = Send(std::move(request));
  if (!response.Ok()) {
    Fail(session, FailureReason::kInitRejected, http::Describe(response));
    return;
  }

  api::v1::MediaUploadResponse init;
  std::string                  error;
  if (!util::ParseJson(response.body, &init, &error)) {
    Fail(session, FailureReason::kInitRejected, "malformed INIT response: " + error);
    return;
  }
  if (init.media_id_string().empty()) {
    Fail(session, FailureReason::kInitRejected, "INIT response without media_id_string");
    return;
  }

  session.media_id = init.media_id_string();
  Transition(session, UploadState::kInitiated);
  TWIPER_LOG_DEBUG("media upload initiated",
                   {StringField("media_id", session.media_id), StringField("media_type", media.media_type),
                    IntField("bytes", static_cast<std::int64_t>(session.total_bytes))});
}

void ChunkedUploader::AppendAll(UploadSession& session, const std::shared_ptr<arrow::Buffer>& bytes, const MediaDescriptor& media) {
  auto chunks = SplitIntoChunks(bytes, options_.chunk_size_bytes);
  for (const auto& chunk : chunks) {
    Transition(session, UploadState::kAppending);
    if (!AppendChunk(session, chunk, media)) return;
    session.bytes_sent += static_cast<std::uint64_t>(chunk->size());
    ++session.chunk_index;
  }
}

bool ChunkedUploader::AppendChunk(UploadSession& session, const std::shared_ptr<arrow::Buffer>& chunk, const MediaDescriptor& media) {
  std::string last_error;
  for (std::uint32_t attempt = 1; attempt <= options_.max_append_attempts; ++attempt) {
    http::HttpRequest request;
    request.method    = http::Method::kPost;
    request.url       = options_.endpoint;
    request.body_kind = http::BodyKind::kMultipart;
    request.parts.push_back({"command", "APPEND", nullptr, "", ""});
    request.parts.push_back({"media_id", session.media_id, nullptr, "", ""});
    request.parts.push_back({"segment_index", std::to_string(session.chunk_index), nullptr, "", ""});
    request.parts.push_back({"media", "", chunk, media.filename.empty() ? "blob" : media.filename, "application/octet-stream"});

    auto response = Send(std::move(request));
    if (response.Ok()) {
      TWIPER_LOG_DEBUG("chunk appended",
                       {StringField("media_id", session.media_id), IntField("segment", session.chunk_index),
                        IntField("attempt", attempt), IntField("bytes", chunk->size())});
      return true;
    }

    last_error = http::Describe(response);
    if (!response.Transient()) {
      Fail(session, FailureReason::kAppendRejected, "segment " + std::to_string(session.chunk_index) + ": " + last_error);
      return false;
    }

    TWIPER_LOG_WARN("chunk append failed",
                    {StringField("media_id", session.media_id), IntField("segment", session.chunk_index),
                     IntField("attempt", attempt), StringField("error", last_error)});
    if (attempt < options_.max_append_attempts) {
      sleeper_->SleepFor(options_.retry.Delay(attempt, util::UniformUnit()));
    }
  }

  Fail(session, FailureReason::kChunkUploadExhausted,
       "segment " + std::to_string(session.chunk_index) + " failed after " + std::to_string(options_.max_append_attempts) +
           " attempts: " + last_error);
  return false;
}

void ChunkedUploader::Finalize(UploadSession& session) {
  http::HttpRequest request;
  request.method    = http::Method::kPost;
  request.url       = options_.endpoint;
  request.body_kind = http::BodyKind::kForm;
  request.form      = {{"command", "FINALIZE"}, {"media_id", session.media_id}};

  auto response = Send(std::move(request));
  if (!response.Ok()) {
    Fail(session, FailureReason::kFinalizeRejected, http::Describe(response));
    return;
  }

  api::v1::MediaUploadResponse finalize;
  std::string                  error;
  if (!util::ParseJson(response.body, &finalize, &error)) {
    Fail(session, FailureReason::kFinalizeRejected, "malformed FINALIZE response: " + error);
    return;
  }

  Transition(session, UploadState::kFinalized);

  if (!finalize.has_processing_info() || finalize.processing_info().state() == kStateSucceeded) {
    Transition(session, UploadState::kSucceeded);
    return;
  }

  const auto& info = finalize.processing_info();
  if (info.state() == kStateFailed) {
    Fail(session, FailureReason::kProcessingFailed, RemoteErrorMessage(info));
    return;
  }

  check_after_secs_ = info.check_after_secs();
  Transition(session, UploadState::kProcessing);
  TWIPER_LOG_INFO("media processing",
                  {StringField("media_id", session.media_id), StringField("state", info.state()),
                   IntField("check_after_secs", info.check_after_secs())});
}

void ChunkedUploader::PollStatus(UploadSession& session) {
  std::chrono::seconds waited{0};

  while (session.state == UploadState::kProcessing) {
    std::chrono::seconds interval = check_after_secs_ > 0 ? std::chrono::seconds(check_after_secs_) : options_.default_status_interval;
    if (waited + interval > options_.max_processing_wait) {
      Fail(session, FailureReason::kProcessingTimeout,
           "processing did not finish within " + std::to_string(options_.max_processing_wait.count()) + "s");
      return;
    }
    sleeper_->SleepFor(interval);
    waited += interval;

    http::HttpRequest request;
    request.method = http::Method::kGet;
    request.url    = options_.endpoint;
    request.query  = {{"command", "STATUS"}, {"media_id", session.media_id}};

    auto response = Send(std::move(request));
    if (!response.Ok()) {
      Fail(session, FailureReason::kStatusRejected, http::Describe(response));
      return;
    }

    api::v1::MediaUploadResponse status;
    std::string                  error;
    if (!util::ParseJson(response.body, &status, &error)) {
      Fail(session, FailureReason::kStatusRejected, "malformed STATUS response: " + error);
      return;
    }

    const auto& info  = status.processing_info();
    const auto& state = info.state();
    if (!status.has_processing_info() || state == kStateSucceeded) {
      Transition(session, UploadState::kSucceeded);
    } else if (state == kStateFailed) {
      Fail(session, FailureReason::kProcessingFailed, RemoteErrorMessage(info));
    } else if (state == kStatePending || state == kStateInProgress) {
      check_after_secs_ = info.check_after_secs();
      Transition(session, UploadState::kProcessing);
      TWIPER_LOG_DEBUG("media still processing",
                       {StringField("media_id", session.media_id), StringField("state", state),
                        IntField("progress", info.progress_percent()), IntField("waited_secs", waited.count())});
    } else {
      Fail(session, FailureReason::kStatusRejected, "unknown processing state '" + state + "'");
    }
  }
}

http::HttpResponse ChunkedUploader::Send(http::HttpRequest request) {
  auth::Authorize(*signer_, &request);
  return http_->Send(request);
}

void ChunkedUploader::Transition(UploadSession& session, UploadState next) {
  if (!CanTransition(session.state, next)) {
    throw util::InvalidState(std::string("illegal upload transition ") + StateName(session.state) + " -> " + StateName(next));
  }
  session.state = next;
}

void ChunkedUploader::Fail(UploadSession& session, FailureReason reason, const std::string& message) {
  session.failed_in = session.state;
  Transition(session, UploadState::kFailed);
  session.failure_reason  = reason;
  session.failure_message = message;
  TWIPER_LOG_ERROR("media upload failed",
                   {StringField("media_id", session.media_id), StringField("reason", ReasonTag(reason)),
                    StringField("state", StateName(session.failed_in)), StringField("error", message)});
}

} // namespace twiper::upload
