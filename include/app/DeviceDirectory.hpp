#pragma once
#include "app/Collaborators.hpp"
#include "model/Device.hpp"
#include <cstddef>
#include <vector>

namespace spytrap::app {

// Last known device list plus a selection cursor. The cursor is always a
// valid index, or 0 when the list is empty.
class DeviceDirectory {
public:
  explicit DeviceDirectory(IDeviceDiscovery& discovery);

  // Re-query discovery and replace the list. Throws DiscoveryError and
  // leaves the current list untouched on failure.
  void refresh();

  // Saturating move by -1 or +1.
  void move_cursor(int delta);

  [[nodiscard]] const model::Device* selected() const;
  [[nodiscard]] const std::vector<model::Device>& devices() const { return devices_; }
  [[nodiscard]] size_t cursor() const { return cursor_; }
  [[nodiscard]] size_t size() const { return devices_.size(); }
  [[nodiscard]] bool empty() const { return devices_.empty(); }

private:
  IDeviceDiscovery& discovery_;
  std::vector<model::Device> devices_;
  size_t cursor_{0};
};

} // namespace spytrap::app
