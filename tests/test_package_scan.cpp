#include "minitest.hpp"
#include "scan/PackageScan.hpp"
#include "rules/RuleRepository.hpp"
#include "fakes.hpp"

using namespace spytrap;

namespace {

class CollectSink : public app::FindingSink {
public:
  bool push(model::Finding f) override {
    if (limit >= 0 && (int)findings.size() >= limit) return false;
    findings.push_back(std::move(f));
    return true;
  }
  void done() override { ++done_calls; }

  std::vector<model::Finding> findings;
  int done_calls{0};
  int limit{-1};
};

app::RuleSet sample_rules() {
  return rules::parse_rules(
    "[app.mspy]\nname = \"mSpy\"\npackages = [\"com.mspy.lite\"]\n"
    "[app.spyzie]\nname = \"Spyzie\"\npackages = [\"com.wifi0\", \"com.spyzie\"]\n");
}

const char* kPm = "pm list packages";
const char* kA11y = "settings get secure enabled_accessibility_services";

} // namespace

TEST(pkg_parse_package_list) {
  auto p = scan::parse_package_list("package:com.android.chrome\r\npackage:com.mspy.lite\n\nnoise\n");
  ASSERT_EQ(p.size(), 2u);
  ASSERT_EQ(p[0], "com.android.chrome");
  ASSERT_EQ(p[1], "com.mspy.lite");
}

TEST(pkg_parse_accessibility_services) {
  ASSERT_TRUE(scan::parse_accessibility_services("null\n").empty());
  ASSERT_TRUE(scan::parse_accessibility_services("").empty());
  auto s = scan::parse_accessibility_services("com.wifi0/.Svc:com.google.talkback/.TB\n");
  ASSERT_EQ(s.size(), 2u);
  ASSERT_EQ(s[0], "com.wifi0/.Svc");
}

TEST(pkg_scan_reports_matches) {
  fakes::Connection conn("a");
  conn.outputs[kPm] = "package:com.android.chrome\npackage:com.mspy.lite\npackage:com.wifi0\n";
  conn.outputs[kA11y] = "com.wifi0/com.wifi0.AccessibilityService\n";
  CollectSink sink;
  scan::PackageScan scan;
  scan.run(conn, sample_rules(), {}, sink);
  ASSERT_EQ(sink.findings.size(), 3u);
  ASSERT_TRUE(sink.findings[0].level == model::Level::High);
  ASSERT_TRUE(sink.findings[0].description.find("com.mspy.lite") != std::string::npos);
  ASSERT_TRUE(sink.findings[0].description.find("mSpy") != std::string::npos);
  ASSERT_TRUE(sink.findings[1].description.find("Spyzie") != std::string::npos);
  ASSERT_TRUE(sink.findings[2].level == model::Level::Critical);
  ASSERT_EQ(sink.done_calls, 1);
}

TEST(pkg_scan_skip_apps) {
  fakes::Connection conn("a");
  conn.outputs[kPm] = "package:com.mspy.lite\n";
  conn.outputs[kA11y] = "null\n";
  CollectSink sink;
  scan::PackageScan scan;
  scan.run(conn, sample_rules(), app::ScanSettings{.skip_apps = true}, sink);
  ASSERT_TRUE(sink.findings.empty());
  ASSERT_EQ(conn.commands.size(), 1u);
  ASSERT_EQ(conn.commands[0], kA11y);
  ASSERT_EQ(sink.done_calls, 1);
}

TEST(pkg_scan_stops_when_sink_closes) {
  fakes::Connection conn("a");
  conn.outputs[kPm] = "package:com.mspy.lite\npackage:com.wifi0\n";
  CollectSink sink;
  sink.limit = 1;
  scan::PackageScan scan;
  scan.run(conn, sample_rules(), {}, sink);
  ASSERT_EQ(sink.findings.size(), 1u);
  ASSERT_EQ(sink.done_calls, 0);
  ASSERT_EQ(conn.commands.size(), 1u);
}

TEST(pkg_scan_connection_failure_propagates) {
  fakes::Connection conn("a");
  conn.abort();
  CollectSink sink;
  scan::PackageScan scan;
  bool threw = false;
  try { scan.run(conn, sample_rules(), {}, sink); } catch (const app::DiscoveryError&) { threw = true; }
  ASSERT_TRUE(threw);
  ASSERT_EQ(sink.done_calls, 0);
}
