#include "inbox_queue.hpp"

#include "internal/util/uuid.hpp"

namespace streamlift::queue {

InboxQueue::InboxQueue(std::chrono::milliseconds visibility_timeout) : visibility_timeout_(visibility_timeout) {
}

std::string InboxQueue::Send(std::string body) {
  Stored stored;
  stored.message_id = util::NewId();
  stored.body       = std::move(body);
  stored.visible_at = SteadyClock::now();

  auto id = stored.message_id;
  {
    std::lock_guard lock(mutex_);
    messages_.push_back(std::move(stored));
  }
  cv_.notify_one();
  return id;
}

std::optional<ReceivedMessage> InboxQueue::Receive(std::chrono::milliseconds wait) {
  const auto       deadline = SteadyClock::now() + wait;
  std::unique_lock lock(mutex_);

  while (!closed_) {
    const auto now       = SteadyClock::now();
    auto       next_wake = deadline;

    for (auto& stored : messages_) {
      if (stored.visible_at <= now) {
        stored.visible_at = now + visibility_timeout_;
        stored.receipt    = util::NewId();
        ++stored.receive_count;
        return ReceivedMessage{stored.message_id, stored.receipt, stored.body, stored.receive_count};
      }
      if (stored.visible_at < next_wake) next_wake = stored.visible_at;
    }

    if (now >= deadline) break;
    cv_.wait_until(lock, next_wake);
  }
  return std::nullopt;
}

bool InboxQueue::Delete(const std::string& receipt) {
  if (receipt.empty()) return false;
  std::lock_guard lock(mutex_);
  const auto      now = SteadyClock::now();
  for (auto it = messages_.begin(); it != messages_.end(); ++it) {
    if (it->receipt == receipt && it->visible_at > now) {
      messages_.erase(it);
      return true;
    }
  }
  return false;
}

bool InboxQueue::ExtendVisibility(const std::string& receipt, std::chrono::milliseconds timeout) {
  if (receipt.empty()) return false;
  std::lock_guard lock(mutex_);
  const auto      now = SteadyClock::now();
  for (auto& stored : messages_) {
    if (stored.receipt == receipt && stored.visible_at > now) {
      stored.visible_at = now + timeout;
      return true;
    }
  }
  return false;
}

size_t InboxQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return messages_.size();
}

void InboxQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

} // namespace streamlift::queue
