#pragma once
#include "app/Collaborators.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace spytrap::rules {

[[nodiscard]] uint64_t fnv1a64(std::string_view data);
[[nodiscard]] std::string hex64(uint64_t v);

// Parse indicator rules from TOML text. Throws app::RuleLoadError.
[[nodiscard]] app::RuleSet parse_rules(std::string_view text);

// Indicator rules stored as a TOML file: one [app.<id>] table per
// stalkerware family with name, packages, certificates and websites.
class FileRuleRepository : public app::IRuleRepository {
public:
  // explicit_path may be empty; the default locations are searched then.
  explicit FileRuleRepository(std::string explicit_path = {}) : explicit_path_(std::move(explicit_path)) {}

  [[nodiscard]] std::filesystem::path locate_rule_file() override;
  [[nodiscard]] app::LoadedRules load_rules(const std::filesystem::path& path) override;

  // Candidate paths in search order.
  [[nodiscard]] std::vector<std::filesystem::path> candidates() const;

private:
  std::string explicit_path_;
};

} // namespace spytrap::rules
