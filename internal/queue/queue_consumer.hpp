#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/catalog/media_locator.hpp"
#include "internal/queue/inbox_queue.hpp"
#include "internal/scheduler/job_scheduler.hpp"

namespace streamlift::queue {

/*
  Moves messages from the inbox into the job scheduler.

  Message disposal:
    unknown / malformed command   → deleted (can never succeed)
    media id not in the library   → deleted
    duplicate of an active job    → deleted at once
    redelivery while job running  → adopted, kept hidden
    job succeeded                 → deleted
    job failed with InputError    → deleted
    any other failure             → left for redelivery

  While a job runs, a heartbeat keeps its message hidden so a long
  transcode does not outlive the visibility timeout.
*/
class QueueConsumer {
 public:
  QueueConsumer(std::shared_ptr<InboxQueue> inbox, std::shared_ptr<scheduler::JobScheduler> scheduler,
                std::shared_ptr<catalog::MediaLocator> locator, uint32_t threads);
  ~QueueConsumer();

  void Start();
  void Stop();

  // One receive and dispatch. False when nothing arrived within wait.
  bool PollOnce(std::chrono::milliseconds wait);

  // Re-hides the message of every job still running. One heartbeat tick.
  void ExtendInFlight();

 private:
  // message_id → most recent receipt, for messages whose job is running.
  struct InFlight {
    std::mutex                         mutex;
    std::map<std::string, std::string> receipts;
  };

  void Run();
  void Heartbeat();
  void Dispatch(const ReceivedMessage& message);
  bool AdoptRedelivery(const ReceivedMessage& message);
  void Forget(const std::string& message_id);

  std::shared_ptr<InboxQueue>              inbox_;
  std::shared_ptr<scheduler::JobScheduler> scheduler_;
  std::shared_ptr<catalog::MediaLocator>   locator_;
  uint32_t                                 thread_count_;
  std::shared_ptr<InFlight>                in_flight_ = std::make_shared<InFlight>();

  std::vector<std::thread> threads_;
  std::thread              heartbeat_;
  std::atomic<bool>        running_{false};
  std::mutex               heartbeat_mutex_;
  std::condition_variable  heartbeat_cv_;
};

} // namespace streamlift::queue
