#pragma once
#include <stdexcept>

namespace spytrap::app {

// Device enumeration or connection failed.
struct DiscoveryError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Indicator rules missing, unreadable or malformed.
struct RuleLoadError : public std::runtime_error { using std::runtime_error::runtime_error; };

// Reading the next terminal event failed.
struct InputError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace spytrap::app
