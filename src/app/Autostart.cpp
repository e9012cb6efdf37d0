#include "app/Autostart.hpp"
#include "util/Log.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace sonitor::app {

std::string desktop_exec_quote(const std::string& path) {
  // Exec quoting puts a backslash before " ` $ \; the string-level escape
  // then doubles every backslash again. Field codes start with '%'.
  std::string q = "\"";
  for (char c : path) {
    switch (c) {
      case '"': case '`': case '$': q += "\\\\"; q += c; break;
      case '\\': q += "\\\\\\\\"; break;
      case '%': q += "%%"; break;
      default: q += c; break;
    }
  }
  q += '"';
  return q;
}

std::string autostart_entry(const std::string& exec_path) {
  std::string s;
  s += "[Desktop Entry]\n";
  s += "Type=Application\n";
  s += "Name=Sonitor\n";
  s += "Comment=Compact system resource monitor\n";
  s += "Exec=" + desktop_exec_quote(exec_path) + "\n";
  s += "Terminal=true\n";
  s += "Categories=System;Monitor;\n";
  s += "X-GNOME-Autostart-enabled=true\n";
  return s;
}

std::string autostart_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/autostart/sonitor.desktop";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/autostart/sonitor.desktop";
  return {};
}

std::string current_executable() {
  char buf[4096];
  ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (n <= 0) return {};
  return std::string(buf, static_cast<size_t>(n));
}

bool set_autostart(bool enabled, const std::string& exec_path) {
  auto path = autostart_file_path();
  if (path.empty()) {
    sonitor::util::log_warn("Autostart", "no XDG_CONFIG_HOME or HOME; cannot locate autostart dir");
    return false;
  }
  std::error_code ec;
  if (!enabled) {
    std::filesystem::remove(path, ec);
    if (ec) {
      sonitor::util::log_warn("Autostart", "failed to remove %s: %s", path.c_str(), ec.message().c_str());
      return false;
    }
    return true;
  }
  if (exec_path.empty()) {
    sonitor::util::log_warn("Autostart", "cannot resolve executable path");
    return false;
  }
  std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
  if (ec) {
    sonitor::util::log_warn("Autostart", "failed to create %s: %s",
                            std::filesystem::path(path).parent_path().c_str(), ec.message().c_str());
    return false;
  }
  std::ofstream out(path, std::ios::trunc);
  out << autostart_entry(exec_path);
  out.flush();
  if (!out.good()) {
    sonitor::util::log_warn("Autostart", "failed to write %s", path.c_str());
    return false;
  }
  return true;
}

bool autostart_installed() {
  auto path = autostart_file_path();
  std::error_code ec;
  return !path.empty() && std::filesystem::exists(path, ec);
}

} // namespace sonitor::app
