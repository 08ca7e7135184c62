#include "ui/Terminal.hpp"
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <string>

namespace spytrap::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};

namespace {

constexpr const char kAltOn[] = "\x1B[?1049h";
constexpr const char kAltOff[] = "\x1B[?1049l";
constexpr const char kCursorHide[] = "\x1B[?25l";
constexpr const char kCursorShow[] = "\x1B[?25h";
constexpr const char kSgrReset[] = "\x1B[0m";

template <size_t N>
void emit(const char (&seq)[N]) { best_effort_write(STDOUT_FILENO, seq, N - 1); }

std::string lower(const char* s) {
  std::string out = s ? s : "";
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

const char* first_set_env(std::initializer_list<const char*> names) {
  for (const char* n : names) {
    const char* v = std::getenv(n);
    if (v && *v) return v;
  }
  return nullptr;
}

// 0 when the tty does not report a size.
winsize stdout_winsize() {
  winsize ws{};
  if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0) ws = winsize{};
  return ws;
}

int env_dimension(const char* name, int defv, int min_v) {
  const char* v = std::getenv(name);
  if (!v || !*v) return defv;
  char* end = nullptr;
  long n = std::strtol(v, &end, 10);
  if (end == v || n <= 0) return defv;
  return std::max(min_v, static_cast<int>(std::min(n, 10000L)));
}

std::string rgb_sgr(int layer, int r, int g, int b) {
  r = std::clamp(r, 0, 255); g = std::clamp(g, 0, 255); b = std::clamp(b, 0, 255);
  return "\x1B[" + std::to_string(layer) + ";2;" + std::to_string(r) + ";" +
         std::to_string(g) + ";" + std::to_string(b) + "m";
}

} // namespace

// Single write, no retry; usable from a signal handler.
void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* nothing to do from here */ }
}

bool write_all(int fd, const char* buf, size_t len, int stall_ms) {
  size_t off = 0;
  while (off < len) {
    ssize_t w = ::write(fd, buf + off, len - off);
    if (w > 0) { off += static_cast<size_t>(w); continue; }
    if (w < 0 && errno == EINTR) continue;
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd p{fd, POLLOUT, 0};
      int rc = ::poll(&p, 1, stall_ms);
      if (rc > 0) continue;
      if (rc < 0 && errno == EINTR) continue;
      return false; // consumer stalled
    }
    return false;
  }
  return true;
}

void restore_terminal_minimal() {
  if (g_alt_in_use.load()) emit(kAltOff);
  emit(kCursorShow);
  emit(kSgrReset);
}

void on_signal(int) {
  restore_terminal_minimal();
  g_stop.store(true);
}

void on_atexit_restore() {
  std::fflush(stdout);
  restore_terminal_minimal();
  if (tty_stdout()) ::tcdrain(STDOUT_FILENO);
}

bool tty_stdout() { return ::isatty(STDOUT_FILENO) == 1; }

bool truecolor_capable() {
  std::string ct = lower(std::getenv("COLORTERM"));
  return ct.find("truecolor") != std::string::npos || ct.find("24bit") != std::string::npos;
}

bool use_unicode() {
  std::string loc = lower(first_set_env({"LC_ALL", "LC_CTYPE", "LANG"}));
  return loc.find("utf-8") != std::string::npos || loc.find("utf8") != std::string::npos;
}

int term_cols() {
  winsize ws = stdout_winsize();
  return ws.ws_col > 0 ? ws.ws_col : env_dimension("COLUMNS", 80, 20);
}

int term_rows() {
  winsize ws = stdout_winsize();
  return ws.ws_row > 0 ? ws.ws_row : env_dimension("LINES", 24, 5);
}

std::string sgr(const char* code) {
  return tty_stdout() ? std::string("\x1B[") + code + "m" : std::string();
}

std::string sgr_reset() { return sgr("0"); }
std::string sgr_bold() { return sgr("1"); }

// 0-7 normal, 8-15 bright, anything above from the 256-color cube.
std::string sgr_palette_idx(int idx) {
  idx = std::max(0, idx);
  if (idx < 8) return sgr(std::to_string(30 + idx).c_str());
  if (idx < 16) return sgr(std::to_string(82 + idx).c_str());
  return sgr(("38;5;" + std::to_string(std::min(idx, 255))).c_str());
}

std::string sgr_truecolor(int r, int g, int b) {
  return tty_stdout() ? rgb_sgr(38, r, g, b) : std::string();
}

std::string sgr_bg_truecolor(int r, int g, int b) {
  if (!tty_stdout()) return {};
  return truecolor_capable() ? rgb_sgr(48, r, g, b) : std::string("\x1B[100m");
}

RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) != 1 || ::tcgetattr(STDIN_FILENO, &old_) != 0) return;
  termios raw = old_;
  // Ctrl+C, Ctrl+R and Ctrl+L must reach the reader as bytes.
  raw.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
  raw.c_iflag &= ~(IXON | ICRNL);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) return;
  old_flags_ = ::fcntl(STDIN_FILENO, F_GETFL, 0);
  if (old_flags_ >= 0) (void)::fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
  active_ = true;
}

RawTermGuard::~RawTermGuard() {
  if (!active_) return;
  (void)::tcsetattr(STDIN_FILENO, TCSANOW, &old_);
  if (old_flags_ >= 0) (void)::fcntl(STDIN_FILENO, F_SETFL, old_flags_);
}

CursorGuard::CursorGuard() : active_(tty_stdout()) {
  if (active_) emit(kCursorHide);
}

CursorGuard::~CursorGuard() {
  if (active_) emit(kCursorShow);
}

AltScreenGuard::AltScreenGuard(bool enable) : active_(enable && tty_stdout()) {
  if (!active_) return;
  emit(kAltOn);
  g_alt_in_use.store(true);
}

AltScreenGuard::~AltScreenGuard() {
  if (!active_) return;
  emit(kAltOff);
  g_alt_in_use.store(false);
}

} // namespace spytrap::ui
