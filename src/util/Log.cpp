#include "util/Log.hpp"
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <mutex>
#include <sys/time.h>

namespace spytrap::util {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::atomic<bool> g_quiet_stderr{false};
std::mutex g_sink_mu;
std::FILE* g_file{nullptr};
}

LogLevel parse_log_level(const std::string& s, LogLevel defv) {
  std::string v = s;
  for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (v == "debug" || v == "trace") return LogLevel::Debug;
  if (v == "info") return LogLevel::Info;
  if (v == "warn" || v == "warning") return LogLevel::Warn;
  if (v == "error") return LogLevel::Error;
  return defv;
}

const char* log_level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

void set_log_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool set_log_file(const std::string& path) {
  std::FILE* f = std::fopen(path.c_str(), "a");
  if (!f) {
    std::fprintf(stderr, "spytrap: log: failed to open %s: %s\n", path.c_str(), std::strerror(errno));
    return false;
  }
  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_file) std::fclose(g_file);
  g_file = f;
  return true;
}

void close_log_file() {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_file) { std::fclose(g_file); g_file = nullptr; }
}

void set_log_quiet_stderr(bool quiet) { g_quiet_stderr.store(quiet); }

void log_write(LogLevel lvl, const char* component, const char* fmt, ...) {
  if (static_cast<int>(lvl) < g_level.load()) return;
  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_file) {
    struct timeval tv{};
    ::gettimeofday(&tv, nullptr);
    std::tm tm{};
    ::localtime_r(&tv.tv_sec, &tm);
    std::fprintf(g_file, "%04d-%02d-%02d %02d:%02d:%02d.%03ld %-5s spytrap: %s: %s\n",
                 tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                 static_cast<long>(tv.tv_usec / 1000), log_level_name(lvl), component, msg);
    std::fflush(g_file);
    return;
  }
  if (g_quiet_stderr.load()) return;
  std::fprintf(stderr, "spytrap: %s: %s\n", component, msg);
}

} // namespace spytrap::util
