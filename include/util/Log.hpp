#pragma once

#include <cstdio>
#include <string>

namespace spytrap::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] LogLevel parse_log_level(const std::string& s, LogLevel defv);
[[nodiscard]] const char* log_level_name(LogLevel lvl);

void set_log_level(LogLevel lvl);
[[nodiscard]] LogLevel log_level();

// Redirect diagnostics to a file opened in append mode. Returns false (and
// keeps the current sink) if the file cannot be opened.
bool set_log_file(const std::string& path);
void close_log_file();

// While the alternate screen is up, stderr output is dropped so it does not
// tear the frame. A log file is never muted.
void set_log_quiet_stderr(bool quiet);

#if defined(__GNUC__)
#define SPYTRAP_PRINTF(a, b) __attribute__((format(printf, a, b)))
#else
#define SPYTRAP_PRINTF(a, b)
#endif

void log_write(LogLevel lvl, const char* component, const char* fmt, ...) SPYTRAP_PRINTF(3, 4);

} // namespace spytrap::util

#define SPYTRAP_LOG_DEBUG(component, ...) ::spytrap::util::log_write(::spytrap::util::LogLevel::Debug, component, __VA_ARGS__)
#define SPYTRAP_LOG_INFO(component, ...)  ::spytrap::util::log_write(::spytrap::util::LogLevel::Info, component, __VA_ARGS__)
#define SPYTRAP_LOG_WARN(component, ...)  ::spytrap::util::log_write(::spytrap::util::LogLevel::Warn, component, __VA_ARGS__)
#define SPYTRAP_LOG_ERROR(component, ...) ::spytrap::util::log_write(::spytrap::util::LogLevel::Error, component, __VA_ARGS__)
