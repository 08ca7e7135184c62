#include "ui/Renderer.hpp"
#include "app/Version.hpp"
#include "ui/Config.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace spytrap::ui {

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  auto top = [&]{
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - display_cols(t));
    return TL + H + t + repeat_str(H, std::max(0, fill - 1)) + TR;
  }();
  out.push_back(top);
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    out.push_back(V + trunc_pad(ln, iw) + V);
  }
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

std::string status_text(bool scanning) {
  return std::string(scanning ? "scanning" : "idle") + " - Press ESC to exit - " +
         app::kProductName + " v" + app::kVersion;
}

static std::string quoted_attr(const model::Device& d, const char* name) {
  auto v = d.attr(name);
  if (!v) return "-";
  return "\"" + *v + "\"";
}

std::string device_row(const model::Device& d, bool selected) {
  std::string serial = d.serial;
  if (serial.size() < 30) serial.append(30 - serial.size(), ' ');
  return std::string(selected ? " > " : "   ") + serial +
         " device=" + quoted_attr(d, "device") +
         ", model=" + quoted_attr(d, "model") +
         ", product=" + quoted_attr(d, "product");
}

// Rows left for box content: status, divider and the two box borders.
static int body_capacity(int rows) { return std::max(1, rows - 4); }

Layout render(const app::AppView& view, int cols, int rows) {
  Layout l;
  l.status = rpad_trunc(status_text(view.scanning), std::max(1, cols));
  l.divider = std::string();
  const int cap = body_capacity(rows);

  if (view.report_shown()) {
    l.findings_view = true;
    l.title = "Findings";
    const auto& report = *view.report;
    // Follow the tail so the newest findings stay visible.
    size_t first = report.size() > (size_t)cap ? report.size() - (size_t)cap : 0;
    for (size_t i = first; i < report.size(); ++i)
      l.body.push_back(model::format_finding(report[i]));
    return l;
  }

  l.title = "Connected devices";
  if (!view.has_devices()) return l;
  const auto& devs = *view.devices;
  size_t cursor = std::min(view.cursor, devs.size() - 1);
  size_t first = cursor >= (size_t)cap ? cursor - (size_t)cap + 1 : 0;
  size_t last = std::min(devs.size(), first + (size_t)cap);
  for (size_t i = first; i < last; ++i) {
    bool sel = (i == cursor);
    if (sel) l.selected = (int)(i - first);
    l.body.push_back(device_row(devs[i], sel));
  }
  return l;
}

// Color the border glyphs of a boxed line, keep content as-is.
static std::string colorize_box_line(const std::string& s, bool border_row, const std::string& content_style) {
  const auto& ui = ui_config();
  if (border_row) {
    size_t lb = s.find('[');
    size_t rb = (lb!=std::string::npos) ? s.find(']', lb+1) : std::string::npos;
    if (lb != std::string::npos && rb != std::string::npos && rb > lb) {
      std::string pre = s.substr(0, lb);
      std::string mid = s.substr(lb + 1, rb - lb - 1);
      std::string suf = s.substr(rb + 1);
      return ui.border + pre + "[" + sgr_reset() + sgr_bold() + ui.title + mid +
             sgr_reset() + ui.border + "]" + suf + sgr_reset();
    }
    return ui.border + s + sgr_reset();
  }
  const char* V = use_unicode() ? "│" : "|";
  const size_t vlen = std::strlen(V);
  size_t fpos = s.find(V);
  size_t lpos = s.rfind(V);
  if (fpos == std::string::npos || lpos == std::string::npos || lpos <= fpos) return s;
  std::string mid = s.substr(fpos + vlen, lpos - (fpos + vlen));
  // Selection marker is the first three columns of a device row.
  if (mid.rfind(" > ", 0) == 0) {
    mid = sgr_bold() + ui.marker + " > " + sgr_reset() + content_style + mid.substr(3);
  }
  return ui.border + V + sgr_reset() + content_style + mid + sgr_reset() + ui.border + V + sgr_reset();
}

std::string Screen::compose(const Layout& l, int cols, int rows) const {
  const bool color = tty_stdout();
  cols = std::max(10, cols);
  rows = std::max(5, rows);
  std::string frame;
  frame.reserve((size_t)rows * (size_t)cols + 64);
  frame += "\x1B[H";

  std::string status = trunc_pad(rpad_trunc(l.status, cols), cols);
  if (color) {
    // Bold the key name the same way the quit hint reads.
    auto pos = status.find("ESC");
    if (pos != std::string::npos)
      status = status.substr(0, pos) + sgr_bold() + "ESC" + sgr_reset() + ui_config().status + status.substr(pos + 3);
    status = ui_config().status + status + sgr_reset();
  }
  frame += status + "\x1B[K\n";
  frame += trunc_pad(l.divider, cols) + "\x1B[K\n";

  auto box = make_box(l.title, l.body, cols, rows - 4);
  for (size_t i = 0; i < box.size(); ++i) {
    const bool border_row = (i == 0 || i + 1 == box.size());
    const int body_idx = (int)i - 1;
    std::string line = box[i];
    if (color) {
      std::string style;
      if (!border_row && body_idx == l.selected) style = ui_config().selected_bg;
      line = colorize_box_line(line, border_row, style);
    }
    frame += line;
    if (i + 1 < box.size()) frame += "\x1B[K\n";
  }
  return frame;
}

void Screen::draw(const app::AppView& view) {
  const int cols = term_cols();
  const int rows = term_rows();
  auto frame = compose(render(view, cols, rows), cols, rows);
  if (!write_all(fd_, frame.data(), frame.size()))
    SPYTRAP_LOG_DEBUG("ui", "frame write incomplete: %s", std::strerror(errno));
}

void Screen::clear() {
  const char* seq = "\x1B[2J\x1B[H";
  (void)write_all(fd_, seq, std::strlen(seq));
}

} // namespace spytrap::ui
