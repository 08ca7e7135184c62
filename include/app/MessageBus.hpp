#pragma once
#include "model/Finding.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>

namespace spytrap::app {

struct ScanEnded {
  bool operator==(const ScanEnded&) const = default;
};

struct FindingMsg {
  model::Finding finding;
  bool operator==(const FindingMsg&) const = default;
};

using Message = std::variant<ScanEnded, FindingMsg>;

[[nodiscard]] std::string describe_message(const Message& m);

// Bounded FIFO channel from scan tasks to the event loop. Producers block
// while the bus is full. ready_fd() is readable exactly while a message is
// queued or the bus is closed, so the consumer can poll() it next to stdin.
class MessageBus {
public:
  static constexpr size_t kDefaultCapacity = 5;

  explicit MessageBus(size_t capacity = kDefaultCapacity);
  ~MessageBus();
  MessageBus(const MessageBus&) = delete;
  MessageBus& operator=(const MessageBus&) = delete;

  // Blocks while full. Returns false if the bus is closed or st is stopped
  // before the message could be queued; the message is dropped then.
  bool send(Message msg, std::stop_token st = {});

  [[nodiscard]] std::optional<Message> try_recv();
  [[nodiscard]] std::optional<Message> recv(std::chrono::milliseconds timeout);

  void close();
  [[nodiscard]] bool closed() const;
  [[nodiscard]] bool closed_and_drained() const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t capacity() const { return capacity_; }
  [[nodiscard]] int ready_fd() const { return event_fd_; }

private:
  std::optional<Message> pop_locked();
  void update_ready_locked();

  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable_any not_full_;
  std::condition_variable_any not_empty_;
  std::deque<Message> queue_;
  bool closed_{false};
  int event_fd_{-1};
  bool signaled_{false};
};

} // namespace spytrap::app
