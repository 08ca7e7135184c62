#pragma once
#include "app/Collaborators.hpp"
#include <string>
#include <vector>

namespace spytrap::scan {

// "package:com.foo" lines from `pm list packages`.
[[nodiscard]] std::vector<std::string> parse_package_list(const std::string& out);

// Colon-separated "pkg/.Service" components from the secure setting.
// "null" and empty output mean none are enabled.
[[nodiscard]] std::vector<std::string> parse_accessibility_services(const std::string& out);

// Installed packages and enabled accessibility services matched against
// the indicator rules.
class PackageScan : public app::IScanAlgorithm {
public:
  void run(app::IConnection& conn, const app::RuleSet& rules,
           const app::ScanSettings& settings, app::FindingSink& sink) override;
};

} // namespace spytrap::scan
