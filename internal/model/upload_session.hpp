#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "internal/model/upload_status.hpp"
#include "internal/util/time.hpp"

namespace streamlift::model {

/*
  Mutable transfer state of one job.

  Owned by the pipeline for the job's lifetime. Segment tasks of one batch run
  concurrently and report through RecordTransferred(), so every accessor locks.

  Counting model:
    skipped_segments   = size of the resume set at job start
    uploaded_segments  = starts at skipped_segments, +1 per fresh transfer;
                         ends at total_segments on success
    transferred_this_run = fresh transfers only
*/
class UploadSession {
 public:
  struct Snapshot {
    std::string      job_id;
    uint32_t         total_segments       = 0;
    uint32_t         uploaded_segments    = 0;
    uint32_t         skipped_segments     = 0;
    uint32_t         transferred_this_run = 0;
    uint64_t         total_size           = 0;
    uint64_t         transferred_bytes    = 0;
    util::TimePoint  start_time{};
    UploadStatus     status = UploadStatus::kPending;
  };

  UploadSession(std::string job_id, uint64_t total_size);

  // Throws util::InvalidState on an illegal transition.
  void         Transition(UploadStatus to);
  UploadStatus Status() const;

  void SetTotalSegments(uint32_t total);
  void SetResumeCount(uint32_t skipped);

  // One segment freshly sent this run. Returns the new uploaded count.
  uint32_t RecordTransferred(uint64_t bytes);

  // uploaded / total * 100, rounded to one decimal. 0 when total is 0.
  double   ProgressPercent() const;
  Snapshot Read() const;

  const std::string& JobId() const {
    return job_id_;
  }

 private:
  const std::string  job_id_;
  mutable std::mutex mutex_;
  Snapshot           state_;
};

double RoundToTenth(double value);

} // namespace streamlift::model
