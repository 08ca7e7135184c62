#pragma once
#include "model/Device.hpp"
#include "model/Finding.hpp"
#include <cstddef>
#include <vector>

namespace spytrap::app {

// Read-only projection of the event loop state. Pointers are borrowed from
// the App and stay valid until its next mutation.
struct AppView {
  const std::vector<model::Device>* devices{nullptr};
  size_t cursor{0};
  const std::vector<model::Finding>* report{nullptr}; // nullptr: no report
  bool scanning{false};

  [[nodiscard]] bool report_shown() const { return report != nullptr; }
  [[nodiscard]] bool has_devices() const { return devices && !devices->empty(); }
};

enum class Action {
  MoveUp,
  MoveDown,
  StartScan,
  CancelScan,
  DismissReport,
  Quit,
  ForceQuit,
  Refresh,
  ClearScreen,
};

[[nodiscard]] inline const char* action_name(Action a) {
  switch (a) {
    case Action::MoveUp: return "move-up";
    case Action::MoveDown: return "move-down";
    case Action::StartScan: return "start-scan";
    case Action::CancelScan: return "cancel-scan";
    case Action::DismissReport: return "dismiss-report";
    case Action::Quit: return "quit";
    case Action::ForceQuit: return "force-quit";
    case Action::Refresh: return "refresh";
    case Action::ClearScreen: return "clear-screen";
  }
  return "?";
}

enum class LoopControl { Continue, Clear, Quit };

} // namespace spytrap::app
