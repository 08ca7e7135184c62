#pragma once
#include <memory>

namespace spytrap::app {

struct ReadySet {
  bool input{false};
  bool bus{false};
  bool hangup{false}; // input side hung up or errored
  [[nodiscard]] bool any() const { return input || bus || hangup; }
};

// Waits until the terminal fd or the bus fd becomes readable. Backed by
// io_uring poll requests when built with liburing, poll(2) otherwise.
class Readiness {
public:
  Readiness(int input_fd, int bus_fd);
  ~Readiness();
  Readiness(const Readiness&) = delete;
  Readiness& operator=(const Readiness&) = delete;

  // Empty set on timeout or signal interruption. Throws std::system_error
  // if the wait itself fails.
  [[nodiscard]] ReadySet wait(int timeout_ms);

private:
  struct Impl;
  int input_fd_;
  int bus_fd_;
  std::unique_ptr<Impl> impl_;
};

} // namespace spytrap::app
