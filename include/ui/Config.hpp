#pragma once

#include <string>

namespace spytrap::ui {

// Resolved SGR sequences for each color role
struct UIConfig {
  std::string border;
  std::string title;
  std::string marker;
  std::string selected_bg;
  std::string status;
};

struct Config {
  struct Adb {
    std::string host{"127.0.0.1"};
    int port{5037};
  } adb;
  struct Rules {
    std::string path; // empty: search the default locations
  } rules;
  struct Scan {
    bool skip_apps{false};
    int bus_capacity{5};
  } scan;
  struct UI {
    bool alt_screen{true};
    int redraw_ms{250};
  } ui;
  struct Log {
    std::string file;
    std::string level{"info"};
  } log;
  struct Colors {
    std::string border;
    std::string title;
    std::string marker;
    std::string selected_bg;
    std::string status;
  } colors;
};

// TOML -> env -> compiled default. A missing or empty path skips the file.
[[nodiscard]] Config load_config(const std::string& path);

// Process-wide configuration, loaded once from config_file_path().
const Config& config();
const UIConfig& ui_config();

// $XDG_CONFIG_HOME/spytrap/config.toml or ~/.config/spytrap/config.toml
[[nodiscard]] std::string config_file_path();

// Environment variable helpers (SPYTRAP_ and spytrap_ prefixes both accepted)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

} // namespace spytrap::ui
