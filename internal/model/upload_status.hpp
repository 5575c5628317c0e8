#pragma once

#include <cstdint>
#include <string_view>

namespace streamlift::model {

enum class UploadStatus : std::uint8_t {
  kPending                 = 0,
  kConverting              = 1,
  kUsingExistingConversion = 2,
  kUploading               = 3,
  kReadyForPlayback        = 4,
  kCompleted               = 5,
  kFailed                  = 6,
};

constexpr bool IsTerminal(UploadStatus status) {
  return status == UploadStatus::kCompleted || status == UploadStatus::kFailed;
}

/*
  converting | using_existing_conversion -> uploading -> ready_for_playback -> completed
  failed is reachable from every non-terminal state.
*/
constexpr bool CanTransition(UploadStatus from, UploadStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == UploadStatus::kFailed) {
    return true;
  }

  switch (from) {
    case UploadStatus::kPending:
      return to == UploadStatus::kConverting || to == UploadStatus::kUsingExistingConversion;
    case UploadStatus::kConverting:
    case UploadStatus::kUsingExistingConversion:
      return to == UploadStatus::kUploading;
    case UploadStatus::kUploading:
      return to == UploadStatus::kReadyForPlayback;
    case UploadStatus::kReadyForPlayback:
      return to == UploadStatus::kCompleted;
    default:
      return false;
  }
}

constexpr std::string_view StageName(UploadStatus status) {
  switch (status) {
    case UploadStatus::kPending:
      return "pending";
    case UploadStatus::kConverting:
      return "converting";
    case UploadStatus::kUsingExistingConversion:
      return "using_existing_conversion";
    case UploadStatus::kUploading:
      return "uploading";
    case UploadStatus::kReadyForPlayback:
      return "ready_for_playback";
    case UploadStatus::kCompleted:
      return "completed";
    case UploadStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace streamlift::model
