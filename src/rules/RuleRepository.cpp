#include "rules/RuleRepository.hpp"
#include "app/Errors.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace spytrap::rules {

using app::RuleLoadError;

uint64_t fnv1a64(std::string_view data) {
  uint64_t h = 0xcbf29ce484222325ULL;
  for (unsigned char c : data) {
    h ^= c;
    h *= 0x100000001b3ULL;
  }
  return h;
}

std::string hex64(uint64_t v) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
  return buf;
}

app::RuleSet parse_rules(std::string_view text) {
  util::TomlReader toml;
  toml.load_string(text);
  app::RuleSet set;
  for (const auto& section : toml.sections("app")) {
    app::Rule r;
    r.id = section.substr(4);
    r.name = toml.get_string(section, "name");
    r.packages = toml.get_list(section, "packages");
    r.certificates = toml.get_list(section, "certificates");
    r.websites = toml.get_list(section, "websites");
    if (r.name.empty()) throw RuleLoadError("rule [" + section + "] has no name");
    if (r.packages.empty()) throw RuleLoadError("rule [" + section + "] lists no packages");
    set.rules.push_back(std::move(r));
  }
  return set;
}

std::vector<std::filesystem::path> FileRuleRepository::candidates() const {
  std::vector<std::filesystem::path> out;
  if (!explicit_path_.empty()) {
    out.emplace_back(explicit_path_);
    return out;
  }
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    out.emplace_back(std::filesystem::path(xdg) / "spytrap" / "ioc.toml");
  if (const char* home = std::getenv("HOME"); home && *home)
    out.emplace_back(std::filesystem::path(home) / ".local" / "share" / "spytrap" / "ioc.toml");
  return out;
}

std::filesystem::path FileRuleRepository::locate_rule_file() {
  auto paths = candidates();
  for (const auto& p : paths) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(p, ec)) return p;
    SPYTRAP_LOG_DEBUG("rules", "no rule file at %s", p.c_str());
  }
  if (!explicit_path_.empty())
    throw RuleLoadError("rule file not found: " + explicit_path_);
  throw RuleLoadError("no rule file found (set --rules, [rules] path or SPYTRAP_RULES)");
}

app::LoadedRules FileRuleRepository::load_rules(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) throw RuleLoadError("cannot open rule file " + path.string());
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw RuleLoadError("cannot read rule file " + path.string());
  const std::string text = ss.str();

  app::LoadedRules loaded;
  loaded.rules = parse_rules(text);
  loaded.content_hash = hex64(fnv1a64(text));
  SPYTRAP_LOG_DEBUG("rules", "parsed %zu rule(s) from %s", loaded.rules.rules.size(), path.c_str());
  return loaded;
}

} // namespace spytrap::rules
