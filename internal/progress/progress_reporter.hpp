#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "internal/api/media_api.hpp"
#include "internal/model/transfer_job.hpp"
#include "internal/model/upload_session.hpp"
#include "internal/transcode/transcoder.hpp"
#include "internal/util/time.hpp"

namespace streamlift::progress {

/*
  now + remaining / rate, or nullopt when rate is not positive.
  remaining is in media seconds, rate in media seconds per wall second.
*/
std::optional<util::TimePoint> EstimateEta(util::TimePoint now, double remaining_seconds, double rate);

/*
  Pushes job status to the status sink.

  Periodic updates (transcode progress, bulk transfer) are throttled to one
  per min_interval. Milestones (priority phase done, completed, failed) are
  always pushed. A failed push is logged and dropped; it never fails the job.
*/
class ProgressReporter {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  ProgressReporter(api::StatusSinkPtr sink, model::TransferJob job, std::chrono::milliseconds min_interval, ClockFn clock = util::Now);

  // Throttled. Percentage is the share of the source already encoded.
  void OnTranscodeProgress(const transcode::TranscodeProgress& progress, double total_duration_seconds);

  // Start of the transfer phase; the transfer rate is measured from here.
  void MarkTransferStart();

  // Throttled. segment_duration_seconds is the nominal length of one segment.
  void OnTransferProgress(const model::UploadSession::Snapshot& snapshot, double segment_duration_seconds);

  // Unthrottled.
  void Milestone(model::UploadStatus status, double percentage, const std::string& message, std::optional<util::TimePoint> eta = std::nullopt);

  uint64_t PushCount() const;

 private:
  bool TakeSlot();
  void Send(const api::StatusUpdate& update);

  api::StatusSinkPtr        sink_;
  model::TransferJob        job_;
  std::chrono::milliseconds min_interval_;
  ClockFn                   clock_;

  mutable std::mutex             mutex_;
  std::optional<util::TimePoint> last_push_;
  util::TimePoint                transfer_start_{};
  uint64_t                       push_count_ = 0;
};

} // namespace streamlift::progress
