#include "minitest.hpp"
#include "fixture.hpp"
#include "ui/Config.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

TEST(config_defaults_without_file_or_env) {
  sonitor::util::TomlReader empty;
  auto c = sonitor::ui::resolve_config(empty, false);
  ASSERT_EQ(c.ui.interval_ms, 1000);
  ASSERT_TRUE(c.ui.alt_screen);
  ASSERT_TRUE(!c.nvidia.disable_nvml);
  ASSERT_EQ(c.log_level, std::string("warn"));
}

TEST(config_file_wins_over_env) {
  ScopedEnv iv("SONITOR_INTERVAL_MS", "400");
  ScopedEnv nv("SONITOR_DISABLE_NVML", "1");
  sonitor::util::TomlReader toml;
  toml.set("ui", "interval_ms", 2000);
  auto c = sonitor::ui::resolve_config(toml, true);
  ASSERT_EQ(c.ui.interval_ms, 2000);
  // not in the file: env applies
  ASSERT_TRUE(c.nvidia.disable_nvml);
}

TEST(config_lowercase_env_alias) {
  ScopedEnv lvl("sonitor_LOG_LEVEL", "debug");
  sonitor::util::TomlReader empty;
  auto c = sonitor::ui::resolve_config(empty, false);
  ASSERT_EQ(c.log_level, std::string("debug"));
}

TEST(config_interval_is_clamped) {
  sonitor::util::TomlReader toml;
  toml.set("ui", "interval_ms", 10);
  ASSERT_EQ(sonitor::ui::resolve_config(toml, true).ui.interval_ms, sonitor::ui::kMinIntervalMs);
  toml.set("ui", "interval_ms", 99999);
  ASSERT_EQ(sonitor::ui::resolve_config(toml, true).ui.interval_ms, sonitor::ui::kMaxIntervalMs);
  toml.set("ui", "interval_ms", std::string("soon"));
  ASSERT_EQ(sonitor::ui::resolve_config(toml, true).ui.interval_ms, 1000);
}

TEST(config_file_path_follows_xdg) {
  ScopedEnv xdg("XDG_CONFIG_HOME", "/tmp/sonitor_xdg");
  ASSERT_EQ(sonitor::ui::config_file_path(), std::string("/tmp/sonitor_xdg/sonitor/config.toml"));
}

TEST(config_env_flag_values) {
  ScopedEnv a("SONITOR_ALT_SCREEN", "no");
  ASSERT_TRUE(!sonitor::ui::getenv_flag("SONITOR_ALT_SCREEN", true));
  ScopedEnv b("SONITOR_ALT_SCREEN", "yes");
  ASSERT_TRUE(sonitor::ui::getenv_flag("SONITOR_ALT_SCREEN", false));
  ASSERT_EQ(sonitor::ui::getenv_int("SONITOR_NOT_SET_ANYWHERE", 7), 7);
}

TEST(log_level_parsing) {
  using sonitor::util::LogLevel;
  ASSERT_TRUE(sonitor::util::parse_log_level("ERROR") == LogLevel::Error);
  ASSERT_TRUE(sonitor::util::parse_log_level("warning") == LogLevel::Warn);
  ASSERT_TRUE(sonitor::util::parse_log_level("Debug") == LogLevel::Debug);
  ASSERT_TRUE(sonitor::util::parse_log_level("loud", LogLevel::Info) == LogLevel::Info);
}

TEST(log_file_sink_receives_lines) {
  FakeRoot root("log");
  auto path = (root.path() / "state" / "sonitor.log").string();
  auto prev = sonitor::util::log_level();
  sonitor::util::set_log_level(sonitor::util::LogLevel::Info);
  ASSERT_TRUE(sonitor::util::set_log_file(path));
  sonitor::util::log_info("Test", "value=%d", 42);
  sonitor::util::log_debug("Test", "hidden");
  ASSERT_TRUE(sonitor::util::set_log_file({}));
  sonitor::util::set_log_level(prev);
  std::ifstream in(path);
  std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  ASSERT_TRUE(body.find("sonitor: Test: [info] value=42") != std::string::npos);
  ASSERT_TRUE(body.find("hidden") == std::string::npos);
}
