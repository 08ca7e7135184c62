#include "scan/PackageScan.hpp"
#include "util/Log.hpp"

namespace spytrap::scan {

static std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) ++b;
  while (e > b && (s[e-1] == ' ' || s[e-1] == '\t' || s[e-1] == '\r' || s[e-1] == '\n')) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> parse_package_list(const std::string& out) {
  std::vector<std::string> pkgs;
  size_t pos = 0;
  while (pos < out.size()) {
    size_t nl = out.find('\n', pos);
    std::string line = trim(out.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos));
    pos = (nl == std::string::npos) ? out.size() : nl + 1;
    static const std::string kPrefix = "package:";
    if (line.rfind(kPrefix, 0) != 0) continue;
    line = line.substr(kPrefix.size());
    if (!line.empty()) pkgs.push_back(line);
  }
  return pkgs;
}

std::vector<std::string> parse_accessibility_services(const std::string& out) {
  std::vector<std::string> svcs;
  const std::string v = trim(out);
  if (v.empty() || v == "null") return svcs;
  size_t pos = 0;
  while (pos <= v.size()) {
    size_t colon = v.find(':', pos);
    std::string item = trim(v.substr(pos, colon == std::string::npos ? std::string::npos : colon - pos));
    if (!item.empty()) svcs.push_back(item);
    if (colon == std::string::npos) break;
    pos = colon + 1;
  }
  return svcs;
}

void PackageScan::run(app::IConnection& conn, const app::RuleSet& rules,
                      const app::ScanSettings& settings, app::FindingSink& sink) {
  const std::string& serial = conn.serial();

  if (!settings.skip_apps) {
    auto pkgs = parse_package_list(conn.shell("pm list packages"));
    SPYTRAP_LOG_DEBUG("scan", "%s: %zu installed package(s)", serial.c_str(), pkgs.size());
    for (const auto& pkg : pkgs) {
      const app::Rule* r = rules.match_package(pkg);
      if (!r) continue;
      model::Finding f{model::Level::High, "Found known stalkerware package: " + pkg + " (" + r->name + ")"};
      if (!sink.push(std::move(f))) return;
    }
  }

  auto svcs = parse_accessibility_services(conn.shell("settings get secure enabled_accessibility_services"));
  for (const auto& svc : svcs) {
    const std::string pkg = svc.substr(0, svc.find('/'));
    const app::Rule* r = rules.match_package(pkg);
    if (!r) continue;
    model::Finding f{model::Level::Critical,
                     "Stalkerware accessibility service is enabled: " + svc + " (" + r->name + ")"};
    if (!sink.push(std::move(f))) return;
  }

  sink.done();
}

} // namespace spytrap::scan
