#include "minitest.hpp"
#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_config_home() {
  auto root = fs::temp_directory_path() / ("timr_test_config_" + std::to_string(::getpid()));
  fs::create_directories(root);
  return root;
}

static void clear_env() {
  for (const char* n : {"TIMR_BELL", "TIMR_PROGRESS_REPORT", "TIMR_CLOCK", "TIMR_BAR_START",
                        "TIMR_BAR_END", "TIMR_BAR_EMPTY", "TIMR_DEBUG", "timr_BELL"})
    ::unsetenv(n);
}

static const char* kSample =
  "# timr config\n"
  "[ui]\n"
  "bell = false\n"
  "clock = \"24h\"\n"
  "bar_start = \"#102030\"   # gradient start\n"
  "\n"
  "[[profiles]]\n"
  "name = \"tea\"\n"
  "duration = \"3m\"\n"
  "\n"
  "[[profiles]]\n"
  "name = \"pomodoro\"\n"
  "duration = \"25m\"\n"
  "\n"
  "[[profiles]]\n"
  "name = \"broken\"\n";

TEST(config_sample_parses) {
  timr::util::TomlReader tr;
  tr.parse(kSample);
  ASSERT_EQ(tr.get_string("ui", "bar_start"), std::string("#102030"));
  ASSERT_EQ(tr.array("profiles").size(), 3u);
}

TEST(config_file_found_under_xdg_home) {
  auto root = make_config_home();
  ::setenv("XDG_CONFIG_HOME", root.c_str(), 1);
  std::ofstream(root / "timr.toml") << kSample;
  timr::util::TomlReader tr;
  ASSERT_TRUE(tr.load(timr::app::config_file_path()));
  std::string err;
  auto p = timr::app::find_profile(tr, "tea", err);
  ASSERT_TRUE(p.has_value());
  ASSERT_EQ(p->duration, std::string("3m"));
  ::unsetenv("XDG_CONFIG_HOME");
  fs::remove_all(root);
}

TEST(config_path_prefers_xdg) {
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
  ASSERT_EQ(timr::app::config_file_path(), std::string("/tmp/xdg/timr.toml"));
  ::unsetenv("XDG_CONFIG_HOME");
  ::setenv("HOME", "/home/someone", 1);
  ASSERT_EQ(timr::app::config_file_path(), std::string("/home/someone/.config/timr.toml"));
}

TEST(config_compiled_defaults) {
  clear_env();
  timr::util::TomlReader tr;
  auto c = timr::app::resolve_config(tr, false);
  ASSERT_TRUE(c.bell);
  ASSERT_TRUE(c.progress_report);
  ASSERT_EQ(c.clock, timr::ui::ClockStyle::H12);
  ASSERT_EQ(c.bar.start.r, 90); ASSERT_EQ(c.bar.start.g, 105); ASSERT_EQ(c.bar.start.b, 237);
  ASSERT_EQ(c.bar.end.r, 123);  ASSERT_EQ(c.bar.end.g, 90);   ASSERT_EQ(c.bar.end.b, 237);
  ASSERT_EQ(c.bar.empty.r, 100);
  ASSERT_FALSE(c.debug);
}

TEST(config_toml_overrides_env) {
  clear_env();
  ::setenv("TIMR_BELL", "1", 1);
  ::setenv("TIMR_PROGRESS_REPORT", "false", 1);
  timr::util::TomlReader tr;
  tr.parse(kSample);
  auto c = timr::app::resolve_config(tr, true);
  ASSERT_FALSE(c.bell);                 // TOML wins
  ASSERT_FALSE(c.progress_report);      // not in TOML: env
  ASSERT_EQ(c.clock, timr::ui::ClockStyle::H24);
  ASSERT_EQ(c.bar.start.r, 0x10); ASSERT_EQ(c.bar.start.g, 0x20); ASSERT_EQ(c.bar.start.b, 0x30);
  clear_env();
}

TEST(config_env_lowercase_and_bad_hex) {
  clear_env();
  ::setenv("timr_BELL", "no", 1);
  ::setenv("TIMR_BAR_END", "purple", 1);
  ::setenv("TIMR_CLOCK", "locale", 1);
  timr::util::TomlReader tr;
  auto c = timr::app::resolve_config(tr, false);
  ASSERT_FALSE(c.bell);
  ASSERT_EQ(c.bar.end.r, 123);
  ASSERT_EQ(c.clock, timr::ui::ClockStyle::Locale);
  clear_env();
}

TEST(hex_rgb_parsing) {
  int r = 0, g = 0, b = 0;
  ASSERT_TRUE(timr::app::parse_hex_rgb("#7B5AED", r, g, b));
  ASSERT_EQ(r, 123); ASSERT_EQ(g, 90); ASSERT_EQ(b, 237);
  ASSERT_FALSE(timr::app::parse_hex_rgb("7B5AED", r, g, b));
  ASSERT_FALSE(timr::app::parse_hex_rgb("#7B5AEZ", r, g, b));
}

TEST(profile_lookup) {
  timr::util::TomlReader tr;
  tr.parse(kSample);
  std::string err;
  auto p = timr::app::find_profile(tr, "pomodoro", err);
  ASSERT_TRUE(p.has_value());
  ASSERT_EQ(p->duration, std::string("25m"));

  ASSERT_FALSE(timr::app::find_profile(tr, "coffee", err).has_value());
  ASSERT_EQ(err, std::string("No profile found matching coffee"));

  ASSERT_FALSE(timr::app::find_profile(tr, "broken", err).has_value());
  ASSERT_EQ(err, std::string("Profile broken has no duration"));
}

TEST(profile_lookup_without_profiles) {
  timr::util::TomlReader tr;
  tr.parse("[ui]\nbell = true\n");
  std::string err;
  ASSERT_FALSE(timr::app::find_profile(tr, "tea", err).has_value());
  ASSERT_EQ(err, std::string("Config does not contain any profiles"));
}
