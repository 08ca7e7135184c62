#include "app/MessageBus.hpp"
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <system_error>

namespace spytrap::app {

std::string describe_message(const Message& m) {
  if (std::holds_alternative<ScanEnded>(m)) return "ScanEnded";
  return "Finding(" + model::format_finding(std::get<FindingMsg>(m).finding) + ")";
}

MessageBus::MessageBus(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
  event_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (event_fd_ < 0) throw std::system_error(errno, std::generic_category(), "eventfd");
}

MessageBus::~MessageBus() {
  if (event_fd_ >= 0) ::close(event_fd_);
}

bool MessageBus::send(Message msg, std::stop_token st) {
  std::unique_lock<std::mutex> lk(mu_);
  bool room = not_full_.wait(lk, st, [&]{ return closed_ || queue_.size() < capacity_; });
  if (!room || closed_ || st.stop_requested()) return false;
  queue_.push_back(std::move(msg));
  update_ready_locked();
  lk.unlock();
  not_empty_.notify_one();
  return true;
}

std::optional<Message> MessageBus::try_recv() {
  std::unique_lock<std::mutex> lk(mu_);
  auto m = pop_locked();
  lk.unlock();
  if (m) not_full_.notify_one();
  return m;
}

std::optional<Message> MessageBus::recv(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  not_empty_.wait_for(lk, timeout, [&]{ return closed_ || !queue_.empty(); });
  auto m = pop_locked();
  lk.unlock();
  if (m) not_full_.notify_one();
  return m;
}

void MessageBus::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    closed_ = true;
    update_ready_locked();
  }
  not_full_.notify_all();
  not_empty_.notify_all();
}

bool MessageBus::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

bool MessageBus::closed_and_drained() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_ && queue_.empty();
}

size_t MessageBus::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

std::optional<Message> MessageBus::pop_locked() {
  if (queue_.empty()) return std::nullopt;
  Message m = std::move(queue_.front());
  queue_.pop_front();
  update_ready_locked();
  return m;
}

// Keep the eventfd counter non-zero iff the consumer has something to do.
void MessageBus::update_ready_locked() {
  bool want = closed_ || !queue_.empty();
  if (want && !signaled_) {
    uint64_t one = 1;
    if (::write(event_fd_, &one, sizeof(one)) == sizeof(one)) signaled_ = true;
  } else if (!want && signaled_) {
    uint64_t v = 0;
    if (::read(event_fd_, &v, sizeof(v)) == sizeof(v)) signaled_ = false;
  }
}

} // namespace spytrap::app
