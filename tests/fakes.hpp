#pragma once
#include "app/Collaborators.hpp"
#include "app/Errors.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <string>
#include <vector>

namespace fakes {

using namespace spytrap;

inline model::Device device(const std::string& serial, const std::string& model_name = "") {
  model::Device d;
  d.serial = serial;
  d.info["state"] = "device";
  if (!model_name.empty()) d.info["model"] = model_name;
  return d;
}

// Scripted shell output. With block_shell set, shell() waits until abort().
class Connection : public app::IConnection {
public:
  explicit Connection(std::string serial) : serial_(std::move(serial)) {}

  const std::string& serial() const override { return serial_; }

  std::string shell(const std::string& cmd) override {
    std::unique_lock<std::mutex> lk(mu_);
    commands.push_back(cmd);
    if (block_shell) cv_.wait(lk, [&]{ return aborted_; });
    if (aborted_) throw app::DiscoveryError("aborted");
    auto it = outputs.find(cmd);
    return it == outputs.end() ? std::string() : it->second;
  }

  void abort() override {
    {
      std::lock_guard<std::mutex> lk(mu_);
      aborted_ = true;
      ++abort_calls;
    }
    cv_.notify_all();
  }

  bool aborted() {
    std::lock_guard<std::mutex> lk(mu_);
    return aborted_;
  }

  std::map<std::string, std::string> outputs;
  std::vector<std::string> commands;
  bool block_shell{false};
  int abort_calls{0};

private:
  std::string serial_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool aborted_{false};
};

class Discovery : public app::IDeviceDiscovery {
public:
  std::vector<model::Device> list_devices() override {
    ++list_calls;
    if (fail_list) throw app::DiscoveryError("adb server not running");
    return devices;
  }

  std::shared_ptr<app::IConnection> connect(const std::string& serial) override {
    if (fail_connect) throw app::DiscoveryError("device offline: " + serial);
    last = std::make_shared<Connection>(serial);
    last->block_shell = block_shell;
    return last;
  }

  std::vector<model::Device> devices;
  bool fail_list{false};
  bool fail_connect{false};
  bool block_shell{false};
  int list_calls{0};
  std::shared_ptr<Connection> last;
};

class Rules : public app::IRuleRepository {
public:
  std::filesystem::path locate_rule_file() override {
    if (fail) throw app::RuleLoadError("no rule file found");
    return "/nonexistent/ioc.toml";
  }
  app::LoadedRules load_rules(const std::filesystem::path&) override {
    return {set, "0000000000000000"};
  }
  app::RuleSet set;
  bool fail{false};
};

// Emits the configured findings, then optionally blocks on the connection
// (which only returns once the scan is aborted) or throws.
class Algorithm : public app::IScanAlgorithm {
public:
  void run(app::IConnection& conn, const app::RuleSet&, const app::ScanSettings& s,
           app::FindingSink& sink) override {
    ++runs;
    skip_apps_seen = s.skip_apps;
    for (const auto& f : findings) {
      if (!sink.push(f)) return;
      ++pushed;
    }
    if (block) (void)conn.shell("sleep forever");
    if (fail) throw std::runtime_error("parse error in package list");
    sink.done();
  }

  std::vector<model::Finding> findings;
  bool block{false};
  bool fail{false};
  std::atomic<int> runs{0};
  std::atomic<int> pushed{0};
  std::atomic<bool> skip_apps_seen{false};
};

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return pred();
}

} // namespace fakes
