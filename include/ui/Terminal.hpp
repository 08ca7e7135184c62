#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <termios.h>

namespace spytrap::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;

void restore_terminal_minimal();
void on_signal(int);
void on_atexit_restore();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool use_unicode();
[[nodiscard]] bool truecolor_capable();
[[nodiscard]] int term_cols();
[[nodiscard]] int term_rows();

// SGR code generation
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_bold();
[[nodiscard]] std::string sgr_palette_idx(int idx);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);
[[nodiscard]] std::string sgr_bg_truecolor(int r, int g, int b);

// One write(2), result ignored. Async-signal-safe.
void best_effort_write(int fd, const char* buf, size_t len);

// Writes the whole buffer, finishing short writes and waiting out EAGAIN
// on non-blocking fds. False on error or when the fd stays unwritable for
// stall_ms.
bool write_all(int fd, const char* buf, size_t len, int stall_ms = 1000);

// RAII guards for terminal state. Each one is a no-op when the fd is not a tty.
class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
  CursorGuard(const CursorGuard&) = delete;
  CursorGuard& operator=(const CursorGuard&) = delete;
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
  AltScreenGuard(const AltScreenGuard&) = delete;
  AltScreenGuard& operator=(const AltScreenGuard&) = delete;
  [[nodiscard]] bool active() const { return active_; }
};

} // namespace spytrap::ui
