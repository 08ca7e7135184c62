#pragma once

#include "app/AppState.hpp"
#include <string>
#include <vector>

namespace spytrap::ui {

// Plain-text frame description. No escape sequences; Screen adds color.
struct Layout {
  std::string status;              // right-aligned to the frame width
  std::string divider;
  std::string title;
  std::vector<std::string> body;   // visible rows only
  int selected{-1};                // index into body, -1 when none
  bool findings_view{false};

  bool operator==(const Layout&) const = default;
};

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0
);

[[nodiscard]] std::string status_text(bool scanning);
[[nodiscard]] std::string device_row(const model::Device& d, bool selected);

// Pure: same view and size always give the same Layout.
[[nodiscard]] Layout render(const app::AppView& view, int cols, int rows);

class Screen {
public:
  explicit Screen(int fd) : fd_(fd) {}

  // Full frame for the given size, starting with a cursor-home sequence.
  [[nodiscard]] std::string compose(const Layout& l, int cols, int rows) const;

  void draw(const app::AppView& view);
  void clear();

private:
  int fd_;
};

} // namespace spytrap::ui
