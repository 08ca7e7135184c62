#ifndef SPYTRAP_HAVE_URING

#include "app/Readiness.hpp"
#include <poll.h>
#include <cerrno>
#include <system_error>

namespace spytrap::app {

struct Readiness::Impl {};

Readiness::Readiness(int input_fd, int bus_fd)
    : input_fd_(input_fd), bus_fd_(bus_fd), impl_(std::make_unique<Impl>()) {}

Readiness::~Readiness() = default;

ReadySet Readiness::wait(int timeout_ms) {
  struct pollfd pfd[2] = {
    {.fd = input_fd_, .events = POLLIN, .revents = 0},
    {.fd = bus_fd_, .events = POLLIN, .revents = 0},
  };
  int rv = ::poll(pfd, 2, timeout_ms);
  if (rv < 0) {
    if (errno == EINTR) return {};
    throw std::system_error(errno, std::generic_category(), "poll");
  }
  ReadySet out{};
  if (rv == 0) return out;
  out.input = (pfd[0].revents & POLLIN) != 0;
  out.hangup = (pfd[0].revents & (POLLHUP | POLLERR | POLLNVAL)) != 0;
  out.bus = (pfd[1].revents & POLLIN) != 0;
  return out;
}

} // namespace spytrap::app

#endif // SPYTRAP_HAVE_URING
