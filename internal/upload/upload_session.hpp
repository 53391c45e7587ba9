#pragma once

#include <cstdint>
#include <string>

#include "internal/upload/upload_state.hpp"

namespace twiper::upload {

/*
  One in-flight chunked upload. Owned by a single Upload() call and never
  persisted: a crash loses the session and the candidate is retried from
  scratch on the next run.
*/
struct UploadSession {
  std::string   media_id;
  std::uint64_t total_bytes = 0;
  std::uint64_t bytes_sent  = 0;
  std::uint32_t chunk_index = 0;

  UploadState   state          = UploadState::kIdle;
  FailureReason failure_reason = FailureReason::kNone;
  std::string   failure_message;
  // State the upload was in when it failed.
  UploadState   failed_in = UploadState::kIdle;

  bool Succeeded() const {
    return state == UploadState::kSucceeded;
  }
};

} // namespace twiper::upload
