#pragma once
#include "app/AppState.hpp"
#include "app/DeviceDirectory.hpp"
#include "app/MessageBus.hpp"
#include "app/ScanSession.hpp"
#include <optional>
#include <vector>

namespace spytrap::ui {
class InputReader;
class Screen;
}

namespace spytrap::app {

// The event loop. Owns the device directory, the report and the active
// session handle; only the loop thread touches them.
class App {
public:
  App(IDeviceDiscovery& discovery, MessageBus& bus, ScanLauncher& launcher, int redraw_ms = 250);

  // Initial device listing. Throws DiscoveryError.
  void init();

  [[nodiscard]] AppView view() const;

  LoopControl handle_action(Action a);
  void handle_message(const Message& m);

  // Runs until input EOF, bus closed and drained, or a quit action.
  // Throws InputError.
  void run(ui::InputReader& input, ui::Screen& screen);

  [[nodiscard]] const DeviceDirectory& directory() const { return directory_; }
  [[nodiscard]] const std::optional<std::vector<model::Finding>>& report() const { return report_; }
  [[nodiscard]] bool scanning() const { return session_.has_value(); }

private:
  DeviceDirectory directory_;
  MessageBus& bus_;
  ScanLauncher& launcher_;
  int redraw_ms_;
  std::optional<std::vector<model::Finding>> report_;
  std::optional<SessionHandle> session_;
};

} // namespace spytrap::app
