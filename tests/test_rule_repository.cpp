#include "minitest.hpp"
#include "rules/RuleRepository.hpp"
#include "app/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace spytrap;
namespace fs = std::filesystem;

static fs::path scratch_dir(const char* name) {
  auto root = fs::temp_directory_path() / ("spytrap_rules_" + std::string(name) + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

static const char* kRules =
  "# indicator rules\n"
  "[app.mspy]\n"
  "name = \"mSpy\"\n"
  "packages = [\"com.mspy.lite\", \"core.update.framework\"]\n"
  "websites = [\"mspy.com\"]\n"
  "\n"
  "[app.thetruthspy]\n"
  "name = \"TheTruthSpy\"\n"
  "packages = [\"com.systemservice\"]\n"
  "certificates = [\"31A6ECECB97AB4EB1E6B1BC3BB3C7A5B1D6D5AB4\"]\n";

TEST(rules_parse_sections) {
  auto set = rules::parse_rules(kRules);
  ASSERT_EQ(set.rules.size(), 2u);
  ASSERT_EQ(set.rules[0].id, "mspy");
  ASSERT_EQ(set.rules[0].name, "mSpy");
  ASSERT_EQ(set.rules[0].packages.size(), 2u);
  ASSERT_EQ(set.rules[0].websites[0], "mspy.com");
  ASSERT_EQ(set.rules[1].certificates.size(), 1u);
  const app::Rule* r = set.match_package("com.systemservice");
  ASSERT_TRUE(r != nullptr);
  ASSERT_EQ(r->name, "TheTruthSpy");
  ASSERT_TRUE(set.match_package("com.android.chrome") == nullptr);
}

TEST(rules_reject_incomplete_entries) {
  bool threw = false;
  try { (void)rules::parse_rules("[app.x]\npackages = [\"a\"]\n"); } catch (const app::RuleLoadError&) { threw = true; }
  ASSERT_TRUE(threw);
  threw = false;
  try { (void)rules::parse_rules("[app.x]\nname = \"X\"\n"); } catch (const app::RuleLoadError&) { threw = true; }
  ASSERT_TRUE(threw);
}

TEST(rules_fnv_hash) {
  ASSERT_EQ(rules::hex64(rules::fnv1a64("")), "cbf29ce484222325");
  ASSERT_EQ(rules::hex64(rules::fnv1a64("a")), "af63dc4c8601ec8c");
}

TEST(rules_load_file_with_hash) {
  auto dir = scratch_dir("load");
  auto path = dir / "ioc.toml";
  std::ofstream(path) << kRules;
  rules::FileRuleRepository repo(path.string());
  ASSERT_EQ(repo.locate_rule_file(), path);
  auto loaded = repo.load_rules(path);
  ASSERT_EQ(loaded.rules.rules.size(), 2u);
  ASSERT_EQ(loaded.content_hash, rules::hex64(rules::fnv1a64(kRules)));
  fs::remove_all(dir);
}

TEST(rules_explicit_path_missing) {
  rules::FileRuleRepository repo("/nonexistent/spytrap/ioc.toml");
  bool threw = false;
  try { (void)repo.locate_rule_file(); } catch (const app::RuleLoadError&) { threw = true; }
  ASSERT_TRUE(threw);
  threw = false;
  try { (void)repo.load_rules("/nonexistent/spytrap/ioc.toml"); } catch (const app::RuleLoadError&) { threw = true; }
  ASSERT_TRUE(threw);
}

TEST(rules_default_locations) {
  auto dir = scratch_dir("xdg");
  const char* old_xdg = std::getenv("XDG_DATA_HOME");
  std::string saved = old_xdg ? old_xdg : "";
  ::setenv("XDG_DATA_HOME", dir.c_str(), 1);

  rules::FileRuleRepository repo;
  auto cands = repo.candidates();
  ASSERT_TRUE(!cands.empty());
  ASSERT_EQ(cands[0], dir / "spytrap" / "ioc.toml");

  fs::create_directories(dir / "spytrap");
  std::ofstream(dir / "spytrap" / "ioc.toml") << kRules;
  ASSERT_EQ(repo.locate_rule_file(), dir / "spytrap" / "ioc.toml");

  if (old_xdg) ::setenv("XDG_DATA_HOME", saved.c_str(), 1); else ::unsetenv("XDG_DATA_HOME");
  fs::remove_all(dir);
}
