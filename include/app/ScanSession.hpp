#pragma once
#include "app/Collaborators.hpp"
#include "app/MessageBus.hpp"
#include "model/Device.hpp"
#include <memory>
#include <stop_token>
#include <vector>

namespace spytrap::app {

// Cancellation sender for one running scan. Cancelling is one-shot and
// idempotent; cancelling a scan that already ended does nothing.
class SessionHandle {
public:
  SessionHandle() = default;
  explicit SessionHandle(std::stop_source src) : src_(std::move(src)) {}

  void cancel() { if (src_.stop_possible()) src_.request_stop(); }
  [[nodiscard]] bool cancel_requested() const { return src_.stop_requested(); }

private:
  std::stop_source src_{std::nostopstate};
};

// Starts background scans. Each scan resolves its device and rules up
// front, then races the scan algorithm against its cancellation token on a
// task thread. Whichever side wins, the task posts exactly one ScanEnded.
// A cancelled scan is abandoned, not wound down: its connection is aborted
// and any findings it still produces are dropped.
class ScanLauncher {
public:
  ScanLauncher(IDeviceDiscovery& discovery, IRuleRepository& rules, IScanAlgorithm& algo,
               MessageBus& bus, ScanSettings settings = {});
  ~ScanLauncher();
  ScanLauncher(const ScanLauncher&) = delete;
  ScanLauncher& operator=(const ScanLauncher&) = delete;

  // Throws DiscoveryError or RuleLoadError before anything is spawned.
  [[nodiscard]] SessionHandle start(const model::Device& device);

  // Cancel every outstanding task and join it.
  void shutdown();

  // Tasks that have not posted ScanEnded yet.
  [[nodiscard]] size_t running_tasks() const;

private:
  class Task;
  void reap();

  IDeviceDiscovery& discovery_;
  IRuleRepository& rules_;
  IScanAlgorithm& algo_;
  MessageBus& bus_;
  ScanSettings settings_;
  std::stop_source shutdown_{};
  std::vector<std::unique_ptr<Task>> tasks_;
};

} // namespace spytrap::app
