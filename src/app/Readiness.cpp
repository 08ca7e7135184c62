#ifdef SPYTRAP_HAVE_URING

#include "app/Readiness.hpp"
#include <liburing.h>
#include <poll.h>
#include <cerrno>
#include <cstdint>
#include <system_error>

namespace spytrap::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { InputPoll = 1, BusPoll = 2 };

struct Readiness::Impl {
  struct io_uring ring{};
  bool input_armed{false};
  bool bus_armed{false};
};

Readiness::Readiness(int input_fd, int bus_fd)
    : input_fd_(input_fd), bus_fd_(bus_fd), impl_(std::make_unique<Impl>()) {
  int rc = io_uring_queue_init(8, &impl_->ring, 0);
  if (rc < 0) throw std::system_error(-rc, std::generic_category(), "io_uring_queue_init");
}

Readiness::~Readiness() {
  io_uring_queue_exit(&impl_->ring);
}

ReadySet Readiness::wait(int timeout_ms) {
  auto& ring = impl_->ring;
  // One-shot polls: re-arm whichever side fired last time.
  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    if (!sqe) return false;
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
    return true;
  };
  if (!impl_->input_armed && submit_poll(input_fd_, UringTag::InputPoll)) impl_->input_armed = true;
  if (!impl_->bus_armed && submit_poll(bus_fd_, UringTag::BusPoll)) impl_->bus_armed = true;
  io_uring_submit(&ring);

  struct __kernel_timespec ts{};
  ts.tv_sec = timeout_ms / 1000;
  ts.tv_nsec = static_cast<long long>(timeout_ms % 1000) * 1000000LL;
  struct io_uring_cqe* cqe = nullptr;
  int ret = io_uring_wait_cqe_timeout(&ring, &cqe, &ts);
  if (ret == -ETIME || ret == -EINTR) return {};
  if (ret < 0) throw std::system_error(-ret, std::generic_category(), "io_uring_wait_cqe_timeout");

  ReadySet out{};
  unsigned head = 0;
  unsigned seen = 0;
  io_uring_for_each_cqe(&ring, head, cqe) {
    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    if (tag == UringTag::InputPoll) {
      impl_->input_armed = false;
      if (res < 0 || (res & (POLLHUP | POLLERR))) out.hangup = true;
      if (res > 0 && (res & POLLIN)) out.input = true;
    } else if (tag == UringTag::BusPoll) {
      impl_->bus_armed = false;
      if (res > 0 && (res & POLLIN)) out.bus = true;
    }
    ++seen;
  }
  io_uring_cq_advance(&ring, seen);
  return out;
}

} // namespace spytrap::app

#endif // SPYTRAP_HAVE_URING
