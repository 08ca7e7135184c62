#include "app/App.hpp"
#include "app/Errors.hpp"
#include "app/Readiness.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Log.hpp"

namespace spytrap::app {

App::App(IDeviceDiscovery& discovery, MessageBus& bus, ScanLauncher& launcher, int redraw_ms)
    : directory_(discovery), bus_(bus), launcher_(launcher), redraw_ms_(redraw_ms) {}

void App::init() {
  directory_.refresh();
}

AppView App::view() const {
  AppView v;
  v.devices = &directory_.devices();
  v.cursor = directory_.cursor();
  v.report = report_ ? &*report_ : nullptr;
  v.scanning = session_.has_value();
  return v;
}

LoopControl App::handle_action(Action a) {
  SPYTRAP_LOG_DEBUG("app", "action %s", action_name(a));
  switch (a) {
    case Action::MoveUp:
      if (!report_) directory_.move_cursor(-1);
      break;
    case Action::MoveDown:
      if (!report_) directory_.move_cursor(+1);
      break;
    case Action::StartScan: {
      if (report_ || session_) break;
      const model::Device* dev = directory_.selected();
      if (!dev) break;
      try {
        SessionHandle h = launcher_.start(*dev);
        report_.emplace();
        session_ = std::move(h);
      } catch (const DiscoveryError& e) {
        SPYTRAP_LOG_ERROR("app", "failed to access device %s: %s", dev->serial.c_str(), e.what());
      } catch (const RuleLoadError& e) {
        SPYTRAP_LOG_ERROR("app", "failed to load rules: %s", e.what());
      }
      break;
    }
    case Action::CancelScan:
      // Handle stays until ScanEnded arrives.
      if (session_) session_->cancel();
      break;
    case Action::DismissReport:
      if (!session_) report_.reset();
      break;
    case Action::Quit:
    case Action::ForceQuit:
      return LoopControl::Quit;
    case Action::Refresh:
      try {
        directory_.refresh();
      } catch (const DiscoveryError& e) {
        SPYTRAP_LOG_WARN("app", "failed to list devices from adb: %s", e.what());
      }
      break;
    case Action::ClearScreen:
      return LoopControl::Clear;
  }
  return LoopControl::Continue;
}

void App::handle_message(const Message& m) {
  SPYTRAP_LOG_DEBUG("app", "received message from bus: %s", describe_message(m).c_str());
  if (std::holds_alternative<ScanEnded>(m)) {
    session_.reset();
  } else if (const auto* f = std::get_if<FindingMsg>(&m)) {
    if (report_) report_->push_back(f->finding);
  }
}

void App::run(ui::InputReader& input, ui::Screen& screen) {
  Readiness ready(input.fd(), bus_.ready_fd());
  bool prefer_input = true;
  while (!ui::g_stop.load()) {
    screen.draw(view());

    ReadySet rs{};
    if (input.has_pending()) {
      rs.input = true;
      if (bus_.size() > 0 || bus_.closed()) rs.bus = true;
    } else {
      rs = ready.wait(redraw_ms_);
    }
    if (!rs.any()) continue;

    const bool take_input = (rs.input || rs.hangup) && (prefer_input || !rs.bus);
    prefer_input = !take_input;

    if (take_input) {
      auto ev = input.next();
      if (!ev) {
        if (input.eof()) {
          SPYTRAP_LOG_DEBUG("app", "input stream ended");
          break;
        }
        continue;
      }
      auto action = ui::interpret(view(), *ev);
      if (!action) continue;
      auto ctl = handle_action(*action);
      if (ctl == LoopControl::Quit) break;
      if (ctl == LoopControl::Clear) screen.clear();
    } else {
      auto msg = bus_.try_recv();
      if (!msg) {
        if (bus_.closed_and_drained()) {
          SPYTRAP_LOG_DEBUG("app", "message bus closed");
          break;
        }
        continue;
      }
      handle_message(*msg);
    }
  }
}

} // namespace spytrap::app
