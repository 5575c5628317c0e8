#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>

namespace streamlift::queue {

struct ReceivedMessage {
  std::string message_id;
  // Valid until the message becomes visible again.
  std::string receipt;
  std::string body;
  uint32_t    receive_count = 0;
};

/*
  In-process message queue with visibility-timeout redelivery.

  Receive() hides a message for visibility_timeout. If it is not deleted
  with its current receipt by then, it becomes visible again and the old
  receipt stops working. Delivery order is send order among visible messages.
*/
class InboxQueue {
 public:
  explicit InboxQueue(std::chrono::milliseconds visibility_timeout);

  // Returns the message id.
  std::string Send(std::string body);

  // Waits up to wait for a visible message. nullopt on timeout or Close().
  std::optional<ReceivedMessage> Receive(std::chrono::milliseconds wait);

  // False when the receipt is unknown or stale.
  bool Delete(const std::string& receipt);

  // Keeps an in-flight message hidden for timeout from now. False when
  // the receipt is unknown or stale.
  bool ExtendVisibility(const std::string& receipt, std::chrono::milliseconds timeout);

  std::chrono::milliseconds VisibilityTimeout() const {
    return visibility_timeout_;
  }

  // Visible plus in-flight messages.
  size_t Depth() const;

  void Close();

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Stored {
    std::string            message_id;
    std::string            body;
    std::string            receipt;
    SteadyClock::time_point visible_at{};
    uint32_t               receive_count = 0;
  };

  const std::chrono::milliseconds visibility_timeout_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::list<Stored>       messages_;
  bool                    closed_ = false;
};

} // namespace streamlift::queue
