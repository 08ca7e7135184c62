#pragma once
#include <map>
#include <optional>
#include <string>

namespace spytrap::model {

// One device as reported by the discovery backend. Replaced wholesale on
// every refresh, never patched in place.
struct Device {
  std::string serial;
  std::map<std::string, std::string> info; // e.g. model, product, device, state

  [[nodiscard]] std::optional<std::string> attr(const std::string& name) const {
    auto it = info.find(name);
    if (it == info.end()) return std::nullopt;
    return it->second;
  }

  bool operator==(const Device&) const = default;
};

} // namespace spytrap::model
