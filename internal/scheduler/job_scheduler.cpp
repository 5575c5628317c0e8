#include "job_scheduler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace streamlift::scheduler {

using streamlift::observability::IntField;
using streamlift::observability::StringField;

std::string_view ToString(JobState state) {
  return state == JobState::kUploading ? "uploading" : "queued";
}

JobScheduler::JobScheduler(JobRunner runner, uint32_t max_concurrent_jobs)
    : runner_(std::move(runner)), max_concurrent_jobs_(max_concurrent_jobs) {
  if (max_concurrent_jobs_ == 0) {
    throw std::invalid_argument("max_concurrent_jobs must be positive");
  }
}

JobScheduler::~JobScheduler() {
  Stop();
}

void JobScheduler::Start() {
  std::lock_guard lock(mutex_);
  if (!threads_.empty()) return;
  for (uint32_t i = 0; i < max_concurrent_jobs_; ++i) {
    threads_.emplace_back(&JobScheduler::WorkerLoop, this);
  }
}

void JobScheduler::AdmitLocked(const std::string& job_id) {
  auto& entry             = entries_.at(job_id);
  entry.record.state      = JobState::kUploading;
  entry.record.start_time = util::Now();
  ++in_flight_;
  observability::Metrics::Instance().SetJobsInFlight(in_flight_);
  admitted_.push_back(job_id);
  work_cv_.notify_one();
}

SubmitResult JobScheduler::Submit(model::TransferJob job, CompletionCallback on_done) {
  std::lock_guard lock(mutex_);
  if (draining_) {
    throw util::InvalidState("scheduler is draining, not accepting " + job.job_id);
  }

  if (entries_.count(job.job_id) > 0) {
    STREAMLIFT_LOG_INFO("Duplicate job discarded", {StringField("job_id", job.job_id),
                                                    StringField("state", std::string(ToString(entries_.at(job.job_id).record.state)))});
    return SubmitResult::kDuplicate;
  }

  const auto job_id = job.job_id;
  Entry      entry;
  entry.job               = std::move(job);
  entry.on_done           = std::move(on_done);
  entry.record.job_id     = job_id;
  entry.record.queue_time = util::Now();
  entries_.emplace(job_id, std::move(entry));

  if (in_flight_ < max_concurrent_jobs_) {
    AdmitLocked(job_id);
    STREAMLIFT_LOG_INFO("Job admitted", {StringField("job_id", job_id), IntField("in_flight", static_cast<int64_t>(in_flight_))});
    return SubmitResult::kStarted;
  }

  waiting_.push_back(job_id);
  STREAMLIFT_LOG_INFO("Job queued", {StringField("job_id", job_id), IntField("position", static_cast<int64_t>(waiting_.size()))});
  return SubmitResult::kQueued;
}

void JobScheduler::WorkerLoop() {
  while (true) {
    model::TransferJob job;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [&] { return stopping_ || !admitted_.empty(); });
      if (admitted_.empty()) return;

      auto job_id = admitted_.front();
      admitted_.pop_front();
      job = entries_.at(job_id).job;
    }

    std::exception_ptr error;
    try {
      runner_(job);
    } catch (const std::exception& e) {
      STREAMLIFT_LOG_WARN("Job failed", {StringField("job_id", job.job_id), StringField("error", e.what())});
      error = std::current_exception();
    }
    Retire(job.job_id, error);
  }
}

void JobScheduler::Retire(const std::string& job_id, std::exception_ptr error) {
  CompletionCallback on_done;
  model::TransferJob job;
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(job_id);
    if (it == entries_.end()) return;

    if (it->second.record.state == JobState::kUploading) {
      --in_flight_;
      observability::Metrics::Instance().SetJobsInFlight(in_flight_);
    }
    on_done = std::move(it->second.on_done);
    job     = std::move(it->second.job);
    entries_.erase(it);

    if (!draining_ && !waiting_.empty() && in_flight_ < max_concurrent_jobs_) {
      auto next = waiting_.front();
      waiting_.pop_front();
      AdmitLocked(next);
      STREAMLIFT_LOG_INFO("Job admitted from queue", {StringField("job_id", next), IntField("in_flight", static_cast<int64_t>(in_flight_))});
    }
  }
  idle_cv_.notify_all();

  STREAMLIFT_LOG_DEBUG("Job retired", {StringField("job_id", job_id)});
  if (!on_done) return;
  try {
    on_done(job, error);
  } catch (const std::exception& e) {
    STREAMLIFT_LOG_ERROR("Completion callback failed", {StringField("job_id", job_id), StringField("error", e.what())});
  }
}

std::vector<ActiveUploadRecord> JobScheduler::List() const {
  std::lock_guard                 lock(mutex_);
  std::vector<ActiveUploadRecord> records;
  records.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) records.push_back(entry.record);
  return records;
}

size_t JobScheduler::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_;
}

size_t JobScheduler::Queued() const {
  std::lock_guard lock(mutex_);
  return waiting_.size();
}

bool JobScheduler::Drain(std::chrono::milliseconds grace) {
  std::deque<std::string> abandoned;
  {
    std::lock_guard lock(mutex_);
    draining_ = true;
    abandoned.swap(waiting_);
  }

  for (const auto& job_id : abandoned) {
    Retire(job_id, std::make_exception_ptr(util::Cancelled("shutdown before " + job_id + " started")));
  }

  std::unique_lock lock(mutex_);
  if (grace == std::chrono::milliseconds::max()) {
    idle_cv_.wait(lock, [&] { return in_flight_ == 0; });
    return true;
  }
  return idle_cv_.wait_for(lock, grace, [&] { return in_flight_ == 0; });
}

void JobScheduler::Stop() {
  bool started = false;
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    started = !threads_.empty();
  }
  // Without worker threads nothing admitted can ever finish.
  Drain(started ? std::chrono::milliseconds::max() : std::chrono::milliseconds(0));
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

} // namespace streamlift::scheduler
