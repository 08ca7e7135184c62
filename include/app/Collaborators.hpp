#pragma once
#include "model/Device.hpp"
#include "model/Finding.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace spytrap::app {

// Live link to one device. Implementations throw DiscoveryError when the
// device cannot be reached.
class IConnection {
public:
  virtual ~IConnection() = default;

  [[nodiscard]] virtual const std::string& serial() const = 0;

  // Run a shell command on the device and return its output.
  [[nodiscard]] virtual std::string shell(const std::string& cmd) = 0;

  // Drop the link immediately. In-flight and later calls fail. Safe to call
  // from another thread and more than once.
  virtual void abort() = 0;
};

class IDeviceDiscovery {
public:
  virtual ~IDeviceDiscovery() = default;
  [[nodiscard]] virtual std::vector<model::Device> list_devices() = 0;
  [[nodiscard]] virtual std::shared_ptr<IConnection> connect(const std::string& serial) = 0;
};

struct Rule {
  std::string id;
  std::string name;
  std::vector<std::string> packages;
  std::vector<std::string> certificates;
  std::vector<std::string> websites;
};

struct RuleSet {
  std::vector<Rule> rules;

  // Rule whose package list contains pkg, or nullptr.
  [[nodiscard]] const Rule* match_package(const std::string& pkg) const {
    for (const auto& r : rules)
      for (const auto& p : r.packages)
        if (p == pkg) return &r;
    return nullptr;
  }
};

struct LoadedRules {
  RuleSet rules;
  std::string content_hash;
};

// Throws RuleLoadError.
class IRuleRepository {
public:
  virtual ~IRuleRepository() = default;
  [[nodiscard]] virtual std::filesystem::path locate_rule_file() = 0;
  [[nodiscard]] virtual LoadedRules load_rules(const std::filesystem::path& path) = 0;
};

struct ScanSettings {
  bool skip_apps{false};
};

// Receives findings while a scan runs. push() returns false once the
// receiving side is gone; a scan should stop producing at that point.
class FindingSink {
public:
  virtual ~FindingSink() = default;
  virtual bool push(model::Finding f) = 0;
  virtual void done() = 0;
};

class IScanAlgorithm {
public:
  virtual ~IScanAlgorithm() = default;
  // Runs to completion or until the connection is dropped. Errors are thrown.
  virtual void run(IConnection& conn, const RuleSet& rules,
                   const ScanSettings& settings, FindingSink& sink) = 0;
};

} // namespace spytrap::app
