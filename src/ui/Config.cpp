#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <exception>
#include <cstdlib>
#include <string>

namespace sonitor::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("SONITOR_", 0) == 0) {
    alt = std::string("sonitor_") + n.substr(8);
  } else if (n.rfind("sonitor_", 0) == 0) {
    alt = std::string("SONITOR_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool getenv_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

int clamp_interval_ms(int ms) {
  return std::clamp(ms, kMinIntervalMs, kMaxIntervalMs);
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sonitor/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/sonitor/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const sonitor::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const sonitor::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return getenv_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const sonitor::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config resolve_config(const sonitor::util::TomlReader& toml, bool have_toml) {
  Config c{};
  // --- [ui] ---
  c.ui.interval_ms = clamp_interval_ms(resolve_int(toml, have_toml, "ui", "interval_ms", "SONITOR_INTERVAL_MS", 1000));
  c.ui.alt_screen  = resolve_bool(toml, have_toml, "ui", "alt_screen", "SONITOR_ALT_SCREEN", true);
  c.log_level      = resolve_string(toml, have_toml, "ui", "log_level", "SONITOR_LOG_LEVEL", "warn");
  // --- [nvidia] ---
  c.nvidia.disable_nvml = resolve_bool(toml, have_toml, "nvidia", "disable_nvml", "SONITOR_DISABLE_NVML", false);
  c.nvidia.nvml_path    = resolve_string(toml, have_toml, "nvidia", "nvml_path", "SONITOR_NVML_PATH", "");
  return c;
}

Config load_config(const std::string& path) {
  sonitor::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  return resolve_config(toml, have_toml);
}

} // namespace sonitor::ui
