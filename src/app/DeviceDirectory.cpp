#include "app/DeviceDirectory.hpp"
#include "util/Log.hpp"

namespace spytrap::app {

DeviceDirectory::DeviceDirectory(IDeviceDiscovery& discovery) : discovery_(discovery) {}

void DeviceDirectory::refresh() {
  auto devices = discovery_.list_devices();
  devices_ = std::move(devices);
  if (cursor_ >= devices_.size()) {
    cursor_ = devices_.empty() ? 0 : devices_.size() - 1;
  }
  SPYTRAP_LOG_DEBUG("devices", "refreshed: %zu device(s), cursor=%zu", devices_.size(), cursor_);
}

void DeviceDirectory::move_cursor(int delta) {
  if (delta < 0) {
    if (cursor_ > 0) cursor_--;
  } else if (delta > 0) {
    if (cursor_ + 1 < devices_.size()) cursor_++;
  }
}

const model::Device* DeviceDirectory::selected() const {
  if (devices_.empty()) return nullptr;
  return &devices_[cursor_];
}

} // namespace spytrap::app
