#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/auth/request_signer.hpp"
#include "internal/http/http_client.hpp"
#include "internal/upload/retry_policy.hpp"
#include "internal/upload/sleeper.hpp"
#include "internal/upload/upload_session.hpp"
#include "internal/util/errors.hpp"

namespace twiper::runtime::config {
class UploadConfig;
}

namespace twiper::upload {

struct UploadOptions {
  std::string               endpoint = "https://upload.twitter.com/1.1/media/upload.json";
  std::uint64_t             chunk_size_bytes    = 1024 * 1024;
  std::uint32_t             max_append_attempts = 5;
  RetryPolicy               retry;
  std::chrono::seconds      default_status_interval{5};
  std::chrono::seconds      max_processing_wait{600};

  static UploadOptions FromConfig(const twiper::runtime::config::UploadConfig& config);
};

struct MediaDescriptor {
  std::string media_type;      // "video/mp4"
  std::string media_category;  // "tweet_video"
  std::string filename;        // used for the multipart part, logs only
};

struct UploadResult {
  UploadSession session;

  bool Succeeded() const {
    return session.Succeeded();
  }

  const std::string& MediaId() const {
    return session.media_id;
  }
};

/*
  Processing failure carrying the reason tag of a failed upload.
*/
class UploadError : public util::ProcessingFailure {
 public:
  UploadError(FailureReason reason, const std::string& msg)
      : util::ProcessingFailure(std::string(ReasonTag(reason)) + ": " + msg), reason_(reason) {
  }

  FailureReason Reason() const {
    return reason_;
  }

 private:
  FailureReason reason_;
};

/*
  INIT / APPEND / FINALIZE / STATUS media upload.

  Every request is signed individually. Only APPEND is retried; a whole
  upload is never restarted. Upload() reports remote failures through the
  returned session (state kFailed plus a reason) and throws only for
  internal errors such as an illegal state transition.

  Not thread-safe; one upload at a time per instance.
*/
class ChunkedUploader {
 public:
  ChunkedUploader(http::HttpClientPtr http, auth::RequestSignerPtr signer, UploadOptions options, SleeperPtr sleeper);

  UploadResult Upload(const std::shared_ptr<arrow::Buffer>& bytes, const MediaDescriptor& media);

  // Upload() that throws UploadError instead of returning a failed session.
  std::string UploadOrThrow(const std::shared_ptr<arrow::Buffer>& bytes, const MediaDescriptor& media);

 private:
  void Init(UploadSession& session, const MediaDescriptor& media);
  void AppendAll(UploadSession& session, const std::shared_ptr<arrow::Buffer>& bytes, const MediaDescriptor& media);
  bool AppendChunk(UploadSession& session, const std::shared_ptr<arrow::Buffer>& chunk, const MediaDescriptor& media);
  void Finalize(UploadSession& session);
  void PollStatus(UploadSession& session);

  http::HttpResponse Send(http::HttpRequest request);

  void Transition(UploadSession& session, UploadState next);
  void Fail(UploadSession& session, FailureReason reason, const std::string& message);

  http::HttpClientPtr    http_;
  auth::RequestSignerPtr signer_;
  UploadOptions          options_;
  SleeperPtr             sleeper_;

  // seconds suggested by the last FINALIZE/STATUS response
  std::int64_t check_after_secs_ = 0;
};

} // namespace twiper::upload
