#include "queue_consumer.hpp"

#include <algorithm>
#include <utility>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/queue/command.hpp"
#include "internal/util/errors.hpp"

namespace streamlift::queue {

using streamlift::observability::IntField;
using streamlift::observability::StringField;

namespace {

constexpr std::chrono::milliseconds kReceiveWait{1000};
constexpr std::chrono::milliseconds kMinHeartbeat{10};

} // namespace

QueueConsumer::QueueConsumer(std::shared_ptr<InboxQueue> inbox, std::shared_ptr<scheduler::JobScheduler> scheduler,
                             std::shared_ptr<catalog::MediaLocator> locator, uint32_t threads)
    : inbox_(std::move(inbox)), scheduler_(std::move(scheduler)), locator_(std::move(locator)), thread_count_(threads == 0 ? 1 : threads) {
}

QueueConsumer::~QueueConsumer() {
  Stop();
}

void QueueConsumer::Start() {
  if (running_.exchange(true)) return;
  for (uint32_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&QueueConsumer::Run, this);
  }
  heartbeat_ = std::thread(&QueueConsumer::Heartbeat, this);
}

void QueueConsumer::Stop() {
  {
    std::lock_guard lock(heartbeat_mutex_);
    running_ = false;
  }
  heartbeat_cv_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  if (heartbeat_.joinable()) heartbeat_.join();
}

void QueueConsumer::Run() {
  while (running_) {
    try {
      PollOnce(kReceiveWait);
    } catch (const std::exception& e) {
      STREAMLIFT_LOG_ERROR("Queue consumer error", {StringField("error", e.what())});
    }
  }
}

// Ticks three times per visibility timeout so one late tick never exposes a message.
void QueueConsumer::Heartbeat() {
  const auto interval = std::max(inbox_->VisibilityTimeout() / 3, kMinHeartbeat);

  std::unique_lock lock(heartbeat_mutex_);
  while (running_) {
    heartbeat_cv_.wait_for(lock, interval, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      ExtendInFlight();
    } catch (const std::exception& e) {
      STREAMLIFT_LOG_ERROR("Visibility heartbeat failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

void QueueConsumer::ExtendInFlight() {
  std::vector<std::pair<std::string, std::string>> held;
  {
    std::lock_guard lock(in_flight_->mutex);
    held.assign(in_flight_->receipts.begin(), in_flight_->receipts.end());
  }
  for (const auto& [message_id, receipt] : held) {
    if (!inbox_->ExtendVisibility(receipt, inbox_->VisibilityTimeout())) {
      // Already redelivered; the next receive adopts the new receipt.
      STREAMLIFT_LOG_DEBUG("Receipt went stale before heartbeat", {StringField("message_id", message_id)});
    }
  }
}

bool QueueConsumer::AdoptRedelivery(const ReceivedMessage& message) {
  {
    std::lock_guard lock(in_flight_->mutex);
    auto            it = in_flight_->receipts.find(message.message_id);
    if (it == in_flight_->receipts.end()) return false;
    it->second = message.receipt;
  }
  // Receive() already hid it for a full timeout; the heartbeat takes over from here.
  STREAMLIFT_LOG_INFO("Job still running, keeping redelivered message",
                      {StringField("message_id", message.message_id), IntField("receive_count", message.receive_count)});
  return true;
}

void QueueConsumer::Forget(const std::string& message_id) {
  std::lock_guard lock(in_flight_->mutex);
  in_flight_->receipts.erase(message_id);
}

bool QueueConsumer::PollOnce(std::chrono::milliseconds wait) {
  auto message = inbox_->Receive(wait);
  if (!message) return false;
  Dispatch(*message);
  return true;
}

void QueueConsumer::Dispatch(const ReceivedMessage& message) {
  if (AdoptRedelivery(message)) return;

  auto command = ParseCommand(message.body);

  if (auto* unknown = std::get_if<UnknownCommand>(&command)) {
    STREAMLIFT_LOG_WARN("Unknown command, deleting message", {StringField("message_id", message.message_id), StringField("command", unknown->command)});
    inbox_->Delete(message.receipt);
    return;
  }
  if (auto* malformed = std::get_if<MalformedCommand>(&command)) {
    STREAMLIFT_LOG_ERROR("Malformed message, deleting", {StringField("message_id", message.message_id), StringField("reason", malformed->reason)});
    inbox_->Delete(message.receipt);
    return;
  }

  const auto& upload = std::get<UploadMediaCommand>(command);
  STREAMLIFT_LOG_INFO("Upload requested", {StringField("job_id", upload.media_id), StringField("media_type", std::string(model::ToString(upload.kind))),
                                           IntField("receive_count", message.receive_count)});

  auto source = locator_->Locate(upload.media_id);
  if (!source) {
    STREAMLIFT_LOG_ERROR("Media not found in library, deleting message", {StringField("job_id", upload.media_id)});
    inbox_->Delete(message.receipt);
    return;
  }

  model::TransferJob job;
  job.job_id      = upload.media_id;
  job.source_path = *source;
  job.kind        = upload.kind;

  {
    std::lock_guard lock(in_flight_->mutex);
    in_flight_->receipts[message.message_id] = message.receipt;
  }

  // The receipt is looked up at completion: a redelivery may have replaced it.
  auto inbox      = inbox_;
  auto in_flight  = in_flight_;
  auto message_id = message.message_id;
  auto on_done    = [inbox, in_flight, message_id](const model::TransferJob& finished, std::exception_ptr error) {
    std::string receipt;
    {
      std::lock_guard lock(in_flight->mutex);
      auto            it = in_flight->receipts.find(message_id);
      if (it != in_flight->receipts.end()) {
        receipt = it->second;
        in_flight->receipts.erase(it);
      }
    }

    if (!error) {
      inbox->Delete(receipt);
      return;
    }
    try {
      std::rethrow_exception(error);
    } catch (const util::InputError& e) {
      STREAMLIFT_LOG_WARN("Job cannot succeed, deleting message", {StringField("job_id", finished.job_id), StringField("error", e.what())});
      inbox->Delete(receipt);
    } catch (const std::exception& e) {
      STREAMLIFT_LOG_INFO("Leaving message for redelivery", {StringField("job_id", finished.job_id), StringField("error", e.what())});
    }
  };

  try {
    if (scheduler_->Submit(std::move(job), on_done) == scheduler::SubmitResult::kDuplicate) {
      Forget(message.message_id);
      inbox_->Delete(message.receipt);
    }
  } catch (const util::InvalidState& e) {
    Forget(message.message_id);
    STREAMLIFT_LOG_INFO("Scheduler not accepting jobs, leaving message", {StringField("job_id", upload.media_id), StringField("error", e.what())});
  } catch (const std::exception&) {
    Forget(message.message_id);
    throw;
  }
}

} // namespace streamlift::queue
