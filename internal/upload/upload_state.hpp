#pragma once

#include <cstdint>

namespace twiper::upload {

enum class UploadState : std::uint8_t {
  kIdle       = 0,
  kInitiated  = 1,
  kAppending  = 2,
  kFinalized  = 3,
  kProcessing = 4,
  kSucceeded  = 5,
  kFailed     = 6,
};

enum class FailureReason : std::uint8_t {
  kNone                 = 0,
  kInitRejected         = 1,
  kAppendRejected       = 2,
  kChunkUploadExhausted = 3,
  kFinalizeRejected     = 4,
  kStatusRejected       = 5,
  kProcessingFailed     = 6,
  kProcessingTimeout    = 7,
};

constexpr bool IsTerminal(UploadState state) {
  return state == UploadState::kSucceeded || state == UploadState::kFailed;
}

constexpr bool CanTransition(UploadState from, UploadState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == UploadState::kFailed) {
    return true;
  }

  switch (from) {
    case UploadState::kIdle:
      return to == UploadState::kInitiated;
    case UploadState::kInitiated:
      return to == UploadState::kAppending;
    case UploadState::kAppending:
      return to == UploadState::kAppending || to == UploadState::kFinalized;
    case UploadState::kFinalized:
      return to == UploadState::kProcessing || to == UploadState::kSucceeded;
    case UploadState::kProcessing:
      return to == UploadState::kProcessing || to == UploadState::kSucceeded;
    default:
      return false;
  }
}

const char* StateName(UploadState state);

// Reason tag used in logs: init-rejected, chunk-upload-exhausted, ...
const char* ReasonTag(FailureReason reason);

} // namespace twiper::upload
