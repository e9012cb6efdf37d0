#pragma once

#include <string>

namespace sonitor::util { class TomlReader; }

namespace sonitor::ui {

// Runtime knobs resolved once at startup: config file -> env -> default.
struct Config {
  struct Ui {
    int interval_ms{1000};   // clamped to [kMinIntervalMs, kMaxIntervalMs]
    bool alt_screen{true};
  } ui;
  struct Nvidia {
    bool disable_nvml{false};
    std::string nvml_path;
  } nvidia;
  std::string log_level{"warn"};
};

inline constexpr int kMinIntervalMs = 250;
inline constexpr int kMaxIntervalMs = 5000;

[[nodiscard]] int clamp_interval_ms(int ms);

// $XDG_CONFIG_HOME/sonitor/config.toml, else ~/.config/sonitor/config.toml.
[[nodiscard]] std::string config_file_path();

// Resolve from an already loaded document (have_toml=false: env/defaults only).
[[nodiscard]] Config resolve_config(const sonitor::util::TomlReader& toml, bool have_toml);
// Load `path` (may be missing) and resolve.
[[nodiscard]] Config load_config(const std::string& path);

// Environment variable helpers. SONITOR_X also matches sonitor_X and back.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool getenv_flag(const char* name, bool defv);

} // namespace sonitor::ui
