#pragma once
#include <string>

namespace spytrap::model {

enum class Level { Low, High, Critical };

// A single indicator match ("suspicion"). Stored and displayed as-is.
struct Finding {
  Level level{Level::Low};
  std::string description;

  bool operator==(const Finding&) const = default;
};

[[nodiscard]] inline const char* level_name(Level l) {
  switch (l) {
    case Level::Low: return "low";
    case Level::High: return "high";
    case Level::Critical: return "critical";
  }
  return "low";
}

[[nodiscard]] inline std::string format_finding(const Finding& f) {
  return std::string("[") + level_name(f.level) + "] " + f.description;
}

} // namespace spytrap::model
