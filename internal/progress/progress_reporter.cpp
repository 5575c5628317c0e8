#include "progress_reporter.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace streamlift::progress {

using streamlift::observability::DoubleField;
using streamlift::observability::StringField;

std::optional<util::TimePoint> EstimateEta(util::TimePoint now, double remaining_seconds, double rate) {
  if (rate <= 0.0) return std::nullopt;
  auto wall = std::chrono::duration<double>(std::max(0.0, remaining_seconds) / rate);
  return now + std::chrono::duration_cast<util::Clock::duration>(wall);
}

ProgressReporter::ProgressReporter(api::StatusSinkPtr sink, model::TransferJob job, std::chrono::milliseconds min_interval, ClockFn clock)
    : sink_(std::move(sink)), job_(std::move(job)), min_interval_(min_interval), clock_(std::move(clock)) {
  transfer_start_ = clock_();
}

bool ProgressReporter::TakeSlot() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        now = clock_();
  if (last_push_ && now - *last_push_ < min_interval_) {
    return false;
  }
  last_push_ = now;
  return true;
}

void ProgressReporter::OnTranscodeProgress(const transcode::TranscodeProgress& progress, double total_duration_seconds) {
  if (total_duration_seconds <= 0.0 || !TakeSlot()) return;

  const double elapsed = std::min(progress.elapsed_seconds, total_duration_seconds);

  api::StatusUpdate update;
  update.percentage = model::RoundToTenth(100.0 * elapsed / total_duration_seconds);
  update.stage_name = std::string(model::StageName(model::UploadStatus::kConverting));
  update.message    = "Converting for streaming";
  update.eta        = EstimateEta(clock_(), total_duration_seconds - elapsed, progress.speed);
  Send(update);
}

void ProgressReporter::MarkTransferStart() {
  std::lock_guard<std::mutex> lock(mutex_);
  transfer_start_ = clock_();
}

void ProgressReporter::OnTransferProgress(const model::UploadSession::Snapshot& snapshot, double segment_duration_seconds) {
  if (snapshot.total_segments == 0 || !TakeSlot()) return;

  util::TimePoint started;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    started = transfer_start_;
  }
  const auto   now          = clock_();
  const double wall_seconds = std::chrono::duration<double>(now - started).count();
  const double rate         = wall_seconds > 0.0 ? snapshot.transferred_this_run * segment_duration_seconds / wall_seconds : 0.0;
  const double remaining    = static_cast<double>(snapshot.total_segments - std::min(snapshot.uploaded_segments, snapshot.total_segments)) *
                           segment_duration_seconds;

  api::StatusUpdate update;
  update.percentage = model::RoundToTenth(100.0 * snapshot.uploaded_segments / snapshot.total_segments);
  update.stage_name = std::string(model::StageName(snapshot.status));
  update.message    = "Uploading " + std::to_string(snapshot.uploaded_segments) + "/" + std::to_string(snapshot.total_segments) + " segments";
  update.eta        = EstimateEta(now, remaining, rate);
  Send(update);
}

void ProgressReporter::Milestone(model::UploadStatus status, double percentage, const std::string& message, std::optional<util::TimePoint> eta) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_push_ = clock_();
  }

  api::StatusUpdate update;
  update.percentage = percentage;
  update.stage_name = std::string(model::StageName(status));
  update.message    = message;
  update.eta        = eta;
  Send(update);
}

void ProgressReporter::Send(const api::StatusUpdate& update) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++push_count_;
  }
  try {
    sink_->Push(job_, update);
  } catch (const std::exception& e) {
    STREAMLIFT_LOG_WARN("Status push failed", {StringField("job_id", job_.job_id), StringField("stage", update.stage_name),
                                               DoubleField("percentage", update.percentage), StringField("error", e.what())});
  }
}

uint64_t ProgressReporter::PushCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return push_count_;
}

} // namespace streamlift::progress
