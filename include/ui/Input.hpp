#pragma once

#include "app/AppState.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <string_view>

namespace spytrap::ui {

enum class Key { None, Char, Enter, Esc, Up, Down, Left, Right, Tab, Backspace };

enum Mod : uint8_t { ModNone = 0, ModCtrl = 1 << 0, ModShift = 1 << 1, ModAlt = 1 << 2 };

struct KeyEvent {
  Key code{Key::None};
  char ch{0};          // for Key::Char, lower-cased when ModCtrl is set
  uint8_t mods{ModNone};

  bool operator==(const KeyEvent&) const = default;
};

[[nodiscard]] constexpr KeyEvent key_char(char c, uint8_t mods = ModNone) { return {Key::Char, c, mods}; }
[[nodiscard]] constexpr KeyEvent key_ctrl(char c) { return {Key::Char, c, ModCtrl}; }
[[nodiscard]] constexpr KeyEvent key(Key k) { return {k, 0, ModNone}; }

// Decode a chunk of raw terminal bytes. Incomplete escape sequences at the
// end of the chunk are dropped; a trailing lone ESC is the Esc key.
void decode_keys(std::string_view bytes, std::deque<KeyEvent>& out);

// Reads and decodes keys from a (non-blocking) terminal fd.
class InputReader {
public:
  explicit InputReader(int fd) : fd_(fd) {}

  // Next decoded key. Reads the fd only when nothing is queued; returns
  // nullopt when no full key is available or the stream ended. Throws
  // app::InputError on read failure.
  [[nodiscard]] std::optional<KeyEvent> next();

  [[nodiscard]] bool has_pending() const { return !pending_.empty(); }
  [[nodiscard]] bool eof() const { return eof_; }
  [[nodiscard]] int fd() const { return fd_; }

private:
  int fd_;
  bool eof_{false};
  std::deque<KeyEvent> pending_;
};

// Map one key to an action for the current view. nullopt means no-op.
[[nodiscard]] std::optional<app::Action> interpret(const app::AppView& view, const KeyEvent& ev);

} // namespace spytrap::ui
