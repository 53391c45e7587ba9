#include "upload_state.hpp"

namespace twiper::upload {

const char* StateName(UploadState state) {
  switch (state) {
    case UploadState::kIdle:
      return "idle";
    case UploadState::kInitiated:
      return "initiated";
    case UploadState::kAppending:
      return "appending";
    case UploadState::kFinalized:
      return "finalized";
    case UploadState::kProcessing:
      return "processing";
    case UploadState::kSucceeded:
      return "succeeded";
    case UploadState::kFailed:
      return "failed";
  }
  return "unknown";
}

const char* ReasonTag(FailureReason reason) {
  switch (reason) {
    case FailureReason::kNone:
      return "none";
    case FailureReason::kInitRejected:
      return "init-rejected";
    case FailureReason::kAppendRejected:
      return "append-rejected";
    case FailureReason::kChunkUploadExhausted:
      return "chunk-upload-exhausted";
    case FailureReason::kFinalizeRejected:
      return "finalize-rejected";
    case FailureReason::kStatusRejected:
      return "status-rejected";
    case FailureReason::kProcessingFailed:
      return "processing-failed";
    case FailureReason::kProcessingTimeout:
      return "processing-timeout";
  }
  return "unknown";
}

} // namespace twiper::upload
