#include "ui/Input.hpp"
#include "app/Errors.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace spytrap::ui {

void decode_keys(std::string_view buf, std::deque<KeyEvent>& out) {
  size_t k = 0;
  const size_t n = buf.size();
  while (k < n) {
    unsigned char c = static_cast<unsigned char>(buf[k++]);
    if (c == 0x1B) {
      if (k >= n) { out.push_back(key(Key::Esc)); break; }
      unsigned char a = static_cast<unsigned char>(buf[k]);
      if (a == '[' || a == 'O') {
        // CSI / SS3: parameters, then a final byte in @..~
        ++k;
        size_t st = k;
        while (k < n && (buf[k] < '@' || buf[k] > '~')) ++k;
        if (k >= n) break;
        char fin = buf[k++];
        std::string_view params = buf.substr(st, k - 1 - st);
        uint8_t mods = ModNone;
        // xterm modifier parameter: "1;5A" is Ctrl+Up, "1;2A" Shift+Up
        if (auto semi = params.find(';'); semi != std::string_view::npos && semi + 1 < params.size()) {
          int m = params[semi + 1] - '1';
          if (m & 1) mods |= ModShift;
          if (m & 2) mods |= ModAlt;
          if (m & 4) mods |= ModCtrl;
        }
        switch (fin) {
          case 'A': out.push_back({Key::Up, 0, mods}); break;
          case 'B': out.push_back({Key::Down, 0, mods}); break;
          case 'C': out.push_back({Key::Right, 0, mods}); break;
          case 'D': out.push_back({Key::Left, 0, mods}); break;
          default: break; // unsupported sequence
        }
        continue;
      }
      if (a == 0x1B) { ++k; out.push_back(key(Key::Esc)); continue; }
      ++k;
      out.push_back({Key::Char, static_cast<char>(a), ModAlt});
      continue;
    }
    if (c == '\r' || c == '\n') { out.push_back(key(Key::Enter)); continue; }
    if (c == '\t') { out.push_back(key(Key::Tab)); continue; }
    if (c == 0x7F || c == 0x08) { out.push_back(key(Key::Backspace)); continue; }
    if (c >= 0x01 && c <= 0x1A) { out.push_back(key_ctrl(static_cast<char>('a' + c - 1))); continue; }
    if (c >= 'A' && c <= 'Z') { out.push_back(key_char(static_cast<char>(c), ModShift)); continue; }
    if (c >= 0x20) { out.push_back(key_char(static_cast<char>(c))); continue; }
  }
}

std::optional<KeyEvent> InputReader::next() {
  if (pending_.empty() && !eof_) {
    char buf[64];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n == 0) {
      eof_ = true;
    } else if (n < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        throw app::InputError(std::string("failed to read terminal input: ") + std::strerror(errno));
      }
    } else {
      decode_keys(std::string_view(buf, static_cast<size_t>(n)), pending_);
    }
  }
  if (pending_.empty()) return std::nullopt;
  KeyEvent ev = pending_.front();
  pending_.pop_front();
  return ev;
}

std::optional<app::Action> interpret(const app::AppView& view, const KeyEvent& ev) {
  using app::Action;
  const bool plain = ev.mods == ModNone;
  const bool is_cancel = (ev.code == Key::Esc && plain)
                      || (ev.code == Key::Char && ev.ch == 'c' && ev.mods == ModCtrl)
                      || (ev.code == Key::Char && ev.ch == 'q' && plain);
  if (is_cancel) {
    if (view.scanning) return Action::CancelScan;
    if (view.report_shown()) return Action::DismissReport;
    return Action::Quit;
  }
  if (ev.code == Key::Char && ev.ch == 'Q' && ev.mods == ModShift) return Action::ForceQuit;
  if (ev.code == Key::Char && ev.mods == ModCtrl) {
    if (ev.ch == 'r') return Action::Refresh;
    if (ev.ch == 'l') return Action::ClearScreen;
    return std::nullopt;
  }
  // Device list only
  if (view.report_shown() || !plain) return std::nullopt;
  switch (ev.code) {
    case Key::Enter: return view.has_devices() ? std::optional<Action>(Action::StartScan) : std::nullopt;
    case Key::Up: return Action::MoveUp;
    case Key::Down: return Action::MoveDown;
    default: return std::nullopt;
  }
}

} // namespace spytrap::ui
