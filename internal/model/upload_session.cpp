#include "upload_session.hpp"

#include <cmath>

#include "internal/util/errors.hpp"

namespace streamlift::model {

double RoundToTenth(double value) {
  return std::round(value * 10.0) / 10.0;
}

UploadSession::UploadSession(std::string job_id, uint64_t total_size) : job_id_(std::move(job_id)) {
  state_.job_id     = job_id_;
  state_.total_size = total_size;
  state_.start_time = util::Now();
}

void UploadSession::Transition(UploadStatus to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CanTransition(state_.status, to)) {
    throw util::InvalidState("upload session " + job_id_ + ": illegal transition " + std::string(StageName(state_.status)) + " -> " +
                             std::string(StageName(to)));
  }
  state_.status = to;
}

UploadStatus UploadSession::Status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.status;
}

void UploadSession::SetTotalSegments(uint32_t total) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.total_segments = total;
}

void UploadSession::SetResumeCount(uint32_t skipped) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.skipped_segments  = skipped;
  state_.uploaded_segments = skipped + state_.transferred_this_run;
}

uint32_t UploadSession::RecordTransferred(uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++state_.transferred_this_run;
  ++state_.uploaded_segments;
  state_.transferred_bytes += bytes;
  return state_.uploaded_segments;
}

double UploadSession::ProgressPercent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.total_segments == 0) return 0.0;
  return RoundToTenth(100.0 * state_.uploaded_segments / state_.total_segments);
}

UploadSession::Snapshot UploadSession::Read() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

} // namespace streamlift::model
