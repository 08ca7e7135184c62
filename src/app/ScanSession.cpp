#include "app/ScanSession.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace spytrap::app {

namespace {

// Forwards findings onto the bus until the owning scan is abandoned.
class BusSink : public FindingSink {
public:
  BusSink(MessageBus& bus, std::stop_token st) : bus_(bus), st_(std::move(st)) {}

  bool push(model::Finding f) override {
    return bus_.send(FindingMsg{std::move(f)}, st_);
  }

  void done() override { done_ = true; }
  [[nodiscard]] bool finished() const { return done_; }

private:
  MessageBus& bus_;
  std::stop_token st_;
  bool done_{false};
};

} // namespace

class ScanLauncher::Task {
public:
  Task(std::shared_ptr<IConnection> conn, RuleSet rules, IScanAlgorithm& algo,
       ScanSettings settings, MessageBus& bus, std::stop_token shutdown)
      : conn_(std::move(conn)), rules_(std::move(rules)), algo_(algo),
        settings_(settings), bus_(bus), shutdown_(std::move(shutdown)) {
    runner_ = std::jthread([this](std::stop_token st){ run(st); });
  }

  ~Task() { cancel(); }

  [[nodiscard]] std::stop_source cancel_source() { return runner_.get_stop_source(); }
  void cancel() { runner_.request_stop(); }
  [[nodiscard]] bool ended() const { return ended_.load(); }
  [[nodiscard]] bool done() const { return done_.load(); }

private:
  void run(std::stop_token cancel) {
    const std::string serial = conn_->serial();
    std::mutex mu;
    std::condition_variable_any cv;
    bool worker_done = false;
    {
      std::jthread worker([&](std::stop_token wst) {
        BusSink sink(bus_, wst);
        try {
          algo_.run(*conn_, rules_, settings_, sink);
          SPYTRAP_LOG_DEBUG("scan", "scan of %s has completed (done signalled: %s)",
                            serial.c_str(), sink.finished() ? "yes" : "no");
        } catch (const std::exception& e) {
          if (wst.stop_requested()) {
            SPYTRAP_LOG_DEBUG("scan", "abandoned scan of %s unwound: %s", serial.c_str(), e.what());
          } else {
            SPYTRAP_LOG_ERROR("scan", "scan of %s failed: %s", serial.c_str(), e.what());
          }
        }
        {
          std::lock_guard<std::mutex> lk(mu);
          worker_done = true;
        }
        cv.notify_all();
      });

      bool completed = false;
      {
        std::unique_lock<std::mutex> lk(mu);
        completed = cv.wait(lk, cancel, [&]{ return worker_done; });
      }
      if (!completed) {
        SPYTRAP_LOG_DEBUG("scan", "scan of %s has been canceled", serial.c_str());
        worker.request_stop();
        conn_->abort();
      }
      if (!bus_.send(ScanEnded{}, shutdown_)) {
        SPYTRAP_LOG_DEBUG("scan", "bus gone, ScanEnded for %s not delivered", serial.c_str());
      }
      ended_.store(true);
    }
    done_.store(true);
  }

  std::shared_ptr<IConnection> conn_;
  RuleSet rules_;
  IScanAlgorithm& algo_;
  ScanSettings settings_;
  MessageBus& bus_;
  std::stop_token shutdown_;
  std::atomic<bool> ended_{false};
  std::atomic<bool> done_{false};
  std::jthread runner_{};
};

ScanLauncher::ScanLauncher(IDeviceDiscovery& discovery, IRuleRepository& rules,
                           IScanAlgorithm& algo, MessageBus& bus, ScanSettings settings)
    : discovery_(discovery), rules_(rules), algo_(algo), bus_(bus), settings_(settings) {}

ScanLauncher::~ScanLauncher() { shutdown(); }

SessionHandle ScanLauncher::start(const model::Device& device) {
  reap();
  auto conn = discovery_.connect(device.serial);
  auto path = rules_.locate_rule_file();
  auto loaded = rules_.load_rules(path);
  SPYTRAP_LOG_INFO("scan", "loaded %zu rule(s) from %s (content hash %s)",
                   loaded.rules.rules.size(), path.c_str(), loaded.content_hash.c_str());
  SPYTRAP_LOG_DEBUG("scan", "starting scan of %s", device.serial.c_str());
  auto task = std::make_unique<Task>(std::move(conn), std::move(loaded.rules), algo_,
                                     settings_, bus_, shutdown_.get_token());
  SessionHandle handle(task->cancel_source());
  tasks_.push_back(std::move(task));
  return handle;
}

void ScanLauncher::shutdown() {
  shutdown_.request_stop();
  for (auto& t : tasks_) t->cancel();
  tasks_.clear();
}

size_t ScanLauncher::running_tasks() const {
  return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                           [](const auto& t){ return !t->ended(); }));
}

void ScanLauncher::reap() {
  std::erase_if(tasks_, [](const auto& t){ return t->done(); });
}

} // namespace spytrap::app
