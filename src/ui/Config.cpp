#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace spytrap::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SPYTRAP_", 0) == 0) {
    alt = std::string("spytrap_") + n.substr(8);
  } else if (n.rfind("spytrap_", 0) == 0) {
    alt = std::string("SPYTRAP_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/spytrap/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/spytrap/config.toml";
  return {};
}

// Resolve a color role from TOML -> compiled default.
// TOML value can be integer (palette index) or "#RRGGBB" (truecolor).
static std::string resolve_color(const util::TomlReader& toml, bool have_toml,
                                  const char* role, int def_palette_idx,
                                  const char* def_hex) {
  if (have_toml && toml.has("colors", role)) {
    std::string val = toml.get_string("colors", role);
    if (!val.empty() && std::isdigit(static_cast<unsigned char>(val[0]))) {
      int idx = def_palette_idx;
      try { idx = std::stoi(val); } catch (const std::exception&) { idx = def_palette_idx; }
      return sgr_palette_idx(idx);
    }
    int r, g, b;
    if (parse_hex_rgb(val, r, g, b) && truecolor_capable()) return sgr_truecolor(r, g, b);
  }
  int r, g, b;
  if (def_hex && truecolor_capable() && parse_hex_rgb(def_hex, r, g, b)) return sgr_truecolor(r, g, b);
  return sgr_palette_idx(def_palette_idx);
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                        const char* section, const char* key,
                        const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                          const char* section, const char* key,
                          const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                   const char* section, const char* key,
                                   const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [adb] ---
  c.adb.host = resolve_string(toml, have_toml, "adb", "host", "SPYTRAP_ADB_HOST", c.adb.host);
  c.adb.port = resolve_int(toml, have_toml, "adb", "port", "SPYTRAP_ADB_PORT", c.adb.port);
  if (c.adb.port <= 0 || c.adb.port > 65535) c.adb.port = 5037;

  // --- [rules] ---
  c.rules.path = resolve_string(toml, have_toml, "rules", "path", "SPYTRAP_RULES", "");

  // --- [scan] ---
  c.scan.skip_apps    = resolve_bool(toml, have_toml, "scan", "skip_apps",    "SPYTRAP_SKIP_APPS", false);
  c.scan.bus_capacity = std::clamp(resolve_int(toml, have_toml, "scan", "bus_capacity", "SPYTRAP_BUS_CAPACITY", 5), 1, 1024);

  // --- [ui] ---
  c.ui.alt_screen = resolve_bool(toml, have_toml, "ui", "alt_screen", "SPYTRAP_ALT_SCREEN", true);
  c.ui.redraw_ms  = std::clamp(resolve_int(toml, have_toml, "ui", "redraw_ms", "SPYTRAP_REDRAW_MS", 250), 10, 1000);

  // --- [log] ---
  c.log.file  = resolve_string(toml, have_toml, "log", "file",  "SPYTRAP_LOG_FILE", "");
  c.log.level = resolve_string(toml, have_toml, "log", "level", "SPYTRAP_LOG_LEVEL", "info");

  // --- [colors] ---
  c.colors.border      = resolve_color(toml, have_toml, "border", 2, nullptr);
  c.colors.title       = resolve_color(toml, have_toml, "title", 15, nullptr);
  c.colors.marker      = resolve_color(toml, have_toml, "marker", 1, nullptr);
  c.colors.status      = resolve_color(toml, have_toml, "status", 15, nullptr);
  c.colors.selected_bg = tty_stdout() ? sgr_bg_truecolor(0x3b, 0x3b, 0x3b) : std::string();
  return c;
}

const Config& config() {
  static Config cfg = load_config(config_file_path());
  return cfg;
}

const UIConfig& ui_config() {
  static UIConfig uic = []{
    const auto& c = config();
    return UIConfig{c.colors.border, c.colors.title, c.colors.marker, c.colors.selected_bg, c.colors.status};
  }();
  return uic;
}

} // namespace spytrap::ui
