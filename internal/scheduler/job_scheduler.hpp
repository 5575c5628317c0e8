#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/model/transfer_job.hpp"
#include "internal/util/time.hpp"

namespace streamlift::scheduler {

enum class JobState {
  kQueued,
  kUploading,
};

struct ActiveUploadRecord {
  std::string                    job_id;
  JobState                       state = JobState::kQueued;
  util::TimePoint                queue_time{};
  std::optional<util::TimePoint> start_time;
};

enum class SubmitResult {
  kStarted,
  kQueued,
  // Same job id already queued or uploading; nothing was recorded.
  kDuplicate,
};

/*
  Bounded job pool, at most one job per id.

      absent → queued → uploading → absent
      absent → uploading → absent           (capacity available)

  Admission and retirement happen under one mutex, so back-to-back
  completions can never admit more than max_concurrent_jobs. Jobs run on
  a fixed set of max_concurrent_jobs threads.
*/
class JobScheduler {
 public:
  using JobRunner = std::function<void(const model::TransferJob&)>;
  // error is null on success.
  using CompletionCallback = std::function<void(const model::TransferJob&, std::exception_ptr error)>;

  JobScheduler(JobRunner runner, uint32_t max_concurrent_jobs);
  ~JobScheduler();

  JobScheduler(const JobScheduler&)            = delete;
  JobScheduler& operator=(const JobScheduler&) = delete;

  void Start();

  // Throws util::InvalidState once draining has begun.
  SubmitResult Submit(model::TransferJob job, CompletionCallback on_done = {});

  std::vector<ActiveUploadRecord> List() const;
  size_t                          InFlight() const;
  size_t                          Queued() const;

  /*
    Stops admission. Jobs still waiting are retired with util::Cancelled.
    Waits up to grace for running jobs; returns true when none remain.
  */
  bool Drain(std::chrono::milliseconds grace);

  // Drains without a deadline and joins the worker threads.
  void Stop();

 private:
  struct Entry {
    model::TransferJob job;
    CompletionCallback on_done;
    ActiveUploadRecord record;
  };

  void WorkerLoop();
  void AdmitLocked(const std::string& job_id);
  void Retire(const std::string& job_id, std::exception_ptr error);

  JobRunner      runner_;
  const uint32_t max_concurrent_jobs_;

  mutable std::mutex           mutex_;
  std::condition_variable      work_cv_;
  std::condition_variable      idle_cv_;
  std::map<std::string, Entry> entries_;
  std::deque<std::string>      waiting_;
  std::deque<std::string>      admitted_;
  size_t                       in_flight_ = 0;
  bool                         draining_  = false;
  bool                         stopping_  = false;

  std::vector<std::thread> threads_;
};

std::string_view ToString(JobState state);

} // namespace streamlift::scheduler
