#pragma once

#ifndef SPYTRAP_VERSION
#define SPYTRAP_VERSION "0.1.0"
#endif

namespace spytrap::app {

inline constexpr const char* kProductName = "spytrap";
inline constexpr const char* kVersion = SPYTRAP_VERSION;

} // namespace spytrap::app
