#include "adb/AdbClient.hpp"
#include "app/App.hpp"
#include "app/Errors.hpp"
#include "app/Version.hpp"
#include "rules/RuleRepository.hpp"
#include "scan/PackageScan.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Log.hpp"
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace spytrap;

namespace {

struct Options {
  bool list{false};
  std::string scan_serial;
};

void print_usage() {
  std::cout << "Usage: spytrap [--rules PATH] [--adb-host H] [--adb-port P] [--skip-apps]\n"
               "               [--log FILE] [--list] [--scan SERIAL] [--version] [-h|--help]\n";
  std::cout << "Keys: Enter scan  Up/Down select  Esc/q cancel/back/quit  Shift+Q quit  "
               "Ctrl+R refresh  Ctrl+L repaint\n";
}

int run_list(app::IDeviceDiscovery& discovery) {
  auto devices = discovery.list_devices();
  for (const auto& d : devices) std::cout << ui::device_row(d, false) << "\n";
  if (devices.empty()) std::cout << "no devices attached\n";
  return 0;
}

// One scan without the TUI; findings are printed as they arrive.
int run_headless_scan(app::IDeviceDiscovery& discovery, app::MessageBus& bus,
                      app::ScanLauncher& launcher, const std::string& serial) {
  model::Device target;
  target.serial = serial;
  for (auto& d : discovery.list_devices())
    if (d.serial == serial) { target = d; break; }

  auto session = launcher.start(target);
  size_t count = 0;
  for (;;) {
    if (ui::g_stop.load()) session.cancel();
    auto msg = bus.recv(std::chrono::milliseconds(200));
    if (!msg) continue;
    if (std::holds_alternative<app::ScanEnded>(*msg)) break;
    std::cout << model::format_finding(std::get<app::FindingMsg>(*msg).finding) << std::endl;
    ++count;
  }
  std::cout << count << " finding(s) on " << serial << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, ui::on_signal);
  std::signal(SIGTERM, ui::on_signal);

  ui::Config cfg = ui::config();
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need_value = [&](const char* flag) -> std::string {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "spytrap: %s needs a value\n", flag);
        std::exit(2);
      }
      return argv[++i];
    };
    if (a == "--rules") cfg.rules.path = need_value("--rules");
    else if (a == "--adb-host") cfg.adb.host = need_value("--adb-host");
    else if (a == "--adb-port") {
      std::string v = need_value("--adb-port");
      try { cfg.adb.port = std::stoi(v); } catch (const std::exception&) { cfg.adb.port = -1; }
      if (cfg.adb.port <= 0 || cfg.adb.port > 65535) {
        std::fprintf(stderr, "spytrap: invalid --adb-port '%s'\n", v.c_str());
        return 2;
      }
    }
    else if (a == "--skip-apps") cfg.scan.skip_apps = true;
    else if (a == "--log") cfg.log.file = need_value("--log");
    else if (a == "--list") opt.list = true;
    else if (a == "--scan") opt.scan_serial = need_value("--scan");
    else if (a == "--version") {
      std::cout << app::kProductName << " " << app::kVersion << "\n";
      return 0;
    }
    else if (a == "-h" || a == "--help") {
      print_usage();
      return 0;
    }
    else {
      std::fprintf(stderr, "spytrap: unknown argument '%s'\n", a.c_str());
      print_usage();
      return 2;
    }
  }

  util::set_log_level(util::parse_log_level(cfg.log.level, util::LogLevel::Info));
  if (!cfg.log.file.empty() && !util::set_log_file(cfg.log.file))
    std::fprintf(stderr, "spytrap: cannot open log file %s, logging to stderr\n", cfg.log.file.c_str());

  try {
    adb::AdbHost discovery(cfg.adb.host, cfg.adb.port);
    rules::FileRuleRepository repo(cfg.rules.path);
    scan::PackageScan algo;
    app::MessageBus bus(static_cast<size_t>(cfg.scan.bus_capacity));
    app::ScanLauncher launcher(discovery, repo, algo, bus, app::ScanSettings{.skip_apps = cfg.scan.skip_apps});

    if (opt.list) return run_list(discovery);
    if (!opt.scan_serial.empty()) return run_headless_scan(discovery, bus, launcher, opt.scan_serial);

    if (!isatty(STDIN_FILENO)) {
      std::fprintf(stderr, "spytrap: interactive mode needs a terminal (try --list or --scan)\n");
      return 2;
    }

    app::App app(discovery, bus, launcher, cfg.ui.redraw_ms);
    app.init();

    bool use_alt = cfg.ui.alt_screen && ui::tty_stdout();
    ui::RawTermGuard raw{}; ui::CursorGuard curs{}; ui::AltScreenGuard alt{use_alt};
    std::atexit(&ui::on_atexit_restore);
    util::set_log_quiet_stderr(alt.active());

    ui::Screen screen(STDOUT_FILENO);
    ui::InputReader input(STDIN_FILENO);
    screen.clear();
    app.run(input, screen);
    launcher.shutdown();
    util::set_log_quiet_stderr(false);
  } catch (const std::exception& e) {
    util::set_log_quiet_stderr(false);
    std::fprintf(stderr, "spytrap: error: %s\n", e.what());
    util::close_log_file();
    return 1;
  }
  util::close_log_file();
  return 0;
}
