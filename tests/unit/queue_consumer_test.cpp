#include "internal/queue/queue_consumer.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>

#include "internal/queue/command.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace std::chrono_literals;
using streamlift::catalog::MediaLocator;
using streamlift::model::MediaKind;
using streamlift::queue::EncodeUploadMedia;
using streamlift::queue::InboxQueue;
using streamlift::queue::QueueConsumer;
using streamlift::scheduler::JobScheduler;
using streamlift::testing::TempDir;
using streamlift::testing::WriteFile;

/*
  Job outcome by id:
    ok-*     succeeds
    bad-*    InputError
    flaky-*  TransientIoError
    slow-*   blocks until Release()
    stall-*  runs 400ms, then TransientIoError
    steady-* runs 400ms, then succeeds
*/
class ScriptedRunner {
 public:
  void Run(const streamlift::model::TransferJob& job) {
    {
      std::lock_guard lock(mutex_);
      sources_.insert(job.source_path);
    }
    if (job.job_id.rfind("bad", 0) == 0) throw streamlift::util::InputError("unusable source");
    if (job.job_id.rfind("flaky", 0) == 0) throw streamlift::util::TransientIoError("storage hiccup");
    if (job.job_id.rfind("stall", 0) == 0) {
      std::this_thread::sleep_for(400ms);
      throw streamlift::util::TransientIoError("transcode aborted");
    }
    if (job.job_id.rfind("steady", 0) == 0) {
      std::this_thread::sleep_for(400ms);
      return;
    }
    if (job.job_id.rfind("slow", 0) == 0) {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return released_; });
    }
  }

  void Release() {
    std::lock_guard lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

  bool SawSource(const std::string& path) {
    std::lock_guard lock(mutex_);
    return sources_.count(path) > 0;
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    released_ = false;
  std::set<std::string>   sources_;
};

struct Harness {
  TempDir                         library{"library"};
  ScriptedRunner                  runner;
  std::shared_ptr<InboxQueue>     inbox;
  std::shared_ptr<JobScheduler>   scheduler = std::make_shared<JobScheduler>([this](const auto& job) { runner.Run(job); }, 2);
  std::shared_ptr<MediaLocator>   locator   = std::make_shared<MediaLocator>(library.Str());
  QueueConsumer                   consumer{inbox, scheduler, locator, 1};

  explicit Harness(std::chrono::milliseconds visibility = 30s) : inbox(std::make_shared<InboxQueue>(visibility)) {
    for (const char* id : {"ok-1", "bad-1", "flaky-1", "slow-1", "stall-1", "steady-1"}) {
      WriteFile(library.Path() / "movies" / (std::string(id) + ".mkv"), "x");
    }
    scheduler->Start();
  }

  ~Harness() {
    runner.Release();
    scheduler->Stop();
  }

  // WaitIdle with the visibility heartbeat driven from the test thread.
  void WaitIdleExtending() {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (scheduler->InFlight() > 0 || !scheduler->List().empty()) {
      assert(std::chrono::steady_clock::now() < deadline);
      consumer.ExtendInFlight();
      std::this_thread::sleep_for(20ms);
    }
  }

  void WaitIdle() {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (scheduler->InFlight() > 0 || !scheduler->List().empty()) {
      assert(std::chrono::steady_clock::now() < deadline);
      std::this_thread::sleep_for(5ms);
    }
  }
};

void TestSuccessDeletesMessage() {
  Harness h;
  h.inbox->Send(EncodeUploadMedia("ok-1", MediaKind::kMovie));
  assert(h.consumer.PollOnce(100ms));
  h.WaitIdle();
  assert(h.inbox->Depth() == 0);
  assert(h.runner.SawSource((h.library.Path() / "movies" / "ok-1.mkv").string()));
}

void TestInputErrorDeletesMessage() {
  Harness h;
  h.inbox->Send(EncodeUploadMedia("bad-1", MediaKind::kMovie));
  assert(h.consumer.PollOnce(100ms));
  h.WaitIdle();
  assert(h.inbox->Depth() == 0);
}

void TestTransientFailureLeavesMessage() {
  Harness h;
  h.inbox->Send(EncodeUploadMedia("flaky-1", MediaKind::kMovie));
  assert(h.consumer.PollOnce(100ms));
  h.WaitIdle();
  assert(h.inbox->Depth() == 1);
}

void TestUnusableMessagesDeleted() {
  Harness h;
  h.inbox->Send("garbage");
  h.inbox->Send(R"({"command":"purge-cache"})");
  h.inbox->Send(EncodeUploadMedia("not-in-library", MediaKind::kEpisode));
  assert(h.consumer.PollOnce(100ms));
  assert(h.consumer.PollOnce(100ms));
  assert(h.consumer.PollOnce(100ms));
  assert(h.inbox->Depth() == 0);
  assert(h.scheduler->List().empty());
}

void TestDuplicateDeletedImmediately() {
  Harness h;
  h.inbox->Send(EncodeUploadMedia("slow-1", MediaKind::kMovie));
  h.inbox->Send(EncodeUploadMedia("slow-1", MediaKind::kMovie));
  assert(h.consumer.PollOnce(100ms));
  assert(h.consumer.PollOnce(100ms));

  // Only the original remains, in flight.
  assert(h.inbox->Depth() == 1);
  assert(h.scheduler->List().size() == 1);

  h.runner.Release();
  h.WaitIdle();
  assert(h.inbox->Depth() == 0);
}

void TestDrainingSchedulerLeavesMessage() {
  Harness h;
  h.scheduler->Drain(0ms);
  h.inbox->Send(EncodeUploadMedia("ok-1", MediaKind::kMovie));
  assert(h.consumer.PollOnce(100ms));
  assert(h.inbox->Depth() == 1);
}

void TestRedeliveryDuringLongJobKeepsMessageForRetry() {
  Harness h(100ms);
  h.inbox->Send(EncodeUploadMedia("stall-1", MediaKind::kMovie));
  assert(h.consumer.PollOnce(100ms));

  // The job outlives the visibility timeout and the message comes back.
  assert(h.consumer.PollOnce(300ms));
  assert(h.scheduler->List().size() == 1);
  assert(h.inbox->Depth() == 1);

  h.WaitIdle();
  assert(h.inbox->Depth() == 1);
  auto retry = h.inbox->Receive(1s);
  assert(retry.has_value());
  assert(retry->receive_count >= 2);
}

void TestRedeliveredMessageDeletedOnSuccess() {
  Harness h(100ms);
  h.inbox->Send(EncodeUploadMedia("steady-1", MediaKind::kMovie));
  assert(h.consumer.PollOnce(100ms));
  assert(h.consumer.PollOnce(300ms));

  // Completion deletes with the receipt of the latest delivery.
  h.WaitIdleExtending();
  assert(h.inbox->Depth() == 0);
}

void TestHeartbeatKeepsRunningJobHidden() {
  Harness h(300ms);
  h.inbox->Send(EncodeUploadMedia("steady-1", MediaKind::kMovie));
  assert(h.consumer.PollOnce(100ms));

  std::this_thread::sleep_for(150ms);
  h.consumer.ExtendInFlight();
  // Past the original timeout.
  std::this_thread::sleep_for(200ms);
  assert(!h.inbox->Receive(10ms).has_value());

  h.WaitIdleExtending();
  assert(h.inbox->Depth() == 0);
}

void TestRunningConsumerRetainsFailedLongJob() {
  Harness h(100ms);
  h.consumer.Start();
  h.inbox->Send(EncodeUploadMedia("stall-1", MediaKind::kMovie));

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (h.scheduler->List().empty()) {
    assert(std::chrono::steady_clock::now() < deadline);
    std::this_thread::sleep_for(5ms);
  }
  h.WaitIdle();
  h.consumer.Stop();

  assert(h.inbox->Depth() == 1);
}

void TestPollTimesOutWhenEmpty() {
  Harness h;
  assert(!h.consumer.PollOnce(10ms));
}

} // namespace

int main() {
  TestSuccessDeletesMessage();
  TestInputErrorDeletesMessage();
  TestTransientFailureLeavesMessage();
  TestUnusableMessagesDeleted();
  TestDuplicateDeletedImmediately();
  TestDrainingSchedulerLeavesMessage();
  TestRedeliveryDuringLongJobKeepsMessageForRetry();
  TestRedeliveredMessageDeletedOnSuccess();
  TestHeartbeatKeepsRunningJobHidden();
  TestRunningConsumerRetainsFailedLongJob();
  TestPollTimesOutWhenEmpty();

  std::cout << "streamlift_unit_queue_consumer: pass\n";
  return 0;
}
