#include "minitest.hpp"
#include "ui/Renderer.hpp"
#include "app/Version.hpp"
#include "fakes.hpp"

using namespace spytrap;

static app::AppView view_of(const std::vector<model::Device>& devs, size_t cursor,
                            const std::vector<model::Finding>* report, bool scanning) {
  app::AppView v;
  v.devices = &devs;
  v.cursor = cursor;
  v.report = report;
  v.scanning = scanning;
  return v;
}

TEST(render_status_line) {
  std::vector<model::Device> devs;
  auto l = ui::render(view_of(devs, 0, nullptr, false), 100, 24);
  ASSERT_EQ((int)l.status.size(), 100);
  std::string expect = std::string("idle - Press ESC to exit - spytrap v") + app::kVersion;
  ASSERT_EQ(l.status.substr(100 - expect.size()), expect);
  std::vector<model::Finding> rep;
  auto s = ui::render(view_of(devs, 0, &rep, true), 100, 24);
  ASSERT_TRUE(s.status.find("scanning - Press ESC") != std::string::npos);
}

TEST(render_device_rows) {
  std::vector<model::Device> devs{fakes::device("emulator-5554", "sdk_gphone64"), fakes::device("R58M")};
  devs[0].info["device"] = "emu64";
  auto l = ui::render(view_of(devs, 1, nullptr, false), 120, 24);
  ASSERT_TRUE(!l.findings_view);
  ASSERT_EQ(l.title, "Connected devices");
  ASSERT_EQ(l.body.size(), 2u);
  ASSERT_EQ(l.selected, 1);
  ASSERT_EQ(l.body[0], "   emulator-5554                  device=\"emu64\", model=\"sdk_gphone64\", product=-");
  ASSERT_EQ(l.body[1].substr(0, 7), " > R58M");
}

TEST(render_findings_iff_report) {
  std::vector<model::Device> devs{fakes::device("a")};
  std::vector<model::Finding> rep;
  auto empty_report = ui::render(view_of(devs, 0, &rep, true), 80, 24);
  ASSERT_TRUE(empty_report.findings_view);
  ASSERT_EQ(empty_report.title, "Findings");
  ASSERT_TRUE(empty_report.body.empty());
  rep.push_back({model::Level::High, "Found known stalkerware package: com.spy"});
  auto done = ui::render(view_of(devs, 0, &rep, false), 80, 24);
  ASSERT_TRUE(done.findings_view);
  ASSERT_EQ(done.body.size(), 1u);
  ASSERT_EQ(done.body[0], "[high] Found known stalkerware package: com.spy");
  ASSERT_EQ(done.selected, -1);
  auto none = ui::render(view_of(devs, 0, nullptr, false), 80, 24);
  ASSERT_TRUE(!none.findings_view);
}

TEST(render_is_idempotent) {
  std::vector<model::Device> devs{fakes::device("a"), fakes::device("b")};
  std::vector<model::Finding> rep{{model::Level::Critical, "x"}};
  auto v1 = view_of(devs, 1, nullptr, false);
  ASSERT_TRUE(ui::render(v1, 80, 24) == ui::render(v1, 80, 24));
  auto v2 = view_of(devs, 0, &rep, true);
  ASSERT_TRUE(ui::render(v2, 80, 24) == ui::render(v2, 80, 24));
  ui::Screen screen(-1);
  auto l = ui::render(v1, 80, 24);
  ASSERT_EQ(screen.compose(l, 80, 24), screen.compose(l, 80, 24));
}

TEST(render_windows_long_device_list) {
  std::vector<model::Device> devs;
  for (int i = 0; i < 50; ++i) devs.push_back(fakes::device("dev" + std::to_string(i)));
  auto l = ui::render(view_of(devs, 40, nullptr, false), 80, 14);
  ASSERT_EQ(l.body.size(), 10u);
  ASSERT_TRUE(l.selected >= 0 && l.selected < 10);
  ASSERT_TRUE(l.body[(size_t)l.selected].find(" > dev40 ") == 0);
}

TEST(render_findings_follow_tail) {
  std::vector<model::Device> devs;
  std::vector<model::Finding> rep;
  for (int i = 0; i < 30; ++i) rep.push_back({model::Level::High, "f" + std::to_string(i)});
  auto l = ui::render(view_of(devs, 0, &rep, true), 80, 12);
  ASSERT_EQ(l.body.size(), 8u);
  ASSERT_EQ(l.body.back(), "[high] f29");
}

TEST(compose_frame_has_box_and_rows) {
  std::vector<model::Device> devs{fakes::device("abc")};
  auto l = ui::render(view_of(devs, 0, nullptr, false), 60, 10);
  ui::Screen screen(-1);
  auto frame = screen.compose(l, 60, 10);
  ASSERT_EQ(frame.rfind("\x1B[H", 0), 0u);
  ASSERT_TRUE(frame.find("Connected devices") != std::string::npos);
  ASSERT_TRUE(frame.find("abc") != std::string::npos);
  size_t lines = 1;
  for (char c : frame) if (c == '\n') ++lines;
  ASSERT_EQ(lines, 10u);
}
