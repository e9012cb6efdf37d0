#include "util/Log.hpp"

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <mutex>

namespace sonitor::util {

namespace {
LogLevel g_level{LogLevel::Warn};
std::FILE* g_file{nullptr};
std::mutex g_mu;

const char* level_tag(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Info:  return "info";
    case LogLevel::Debug: return "debug";
  }
  return "?";
}

void vlog(LogLevel lvl, const char* component, const char* fmt, std::va_list ap) {
  if (static_cast<int>(lvl) > static_cast<int>(g_level)) return;
  char msg[1024];
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_file) {
    std::fprintf(g_file, "sonitor: %s: [%s] %s\n", component, level_tag(lvl), msg);
    std::fflush(g_file);
    return;
  }
  std::fprintf(stderr, "sonitor: %s: %s\n", component, msg);
}
} // namespace

LogLevel parse_log_level(std::string_view s, LogLevel def) {
  std::string low;
  for (char c : s) low.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (low == "error") return LogLevel::Error;
  if (low == "warn" || low == "warning") return LogLevel::Warn;
  if (low == "info") return LogLevel::Info;
  if (low == "debug") return LogLevel::Debug;
  return def;
}

void set_log_level(LogLevel lvl) { g_level = lvl; }
LogLevel log_level() { return g_level; }

bool set_log_file(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_file) { std::fclose(g_file); g_file = nullptr; }
  if (path.empty()) return true;
  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  g_file = std::fopen(path.c_str(), "a");
  if (!g_file) {
    std::fprintf(stderr, "sonitor: Log: cannot open %s\n", path.c_str());
    return false;
  }
  return true;
}

std::string default_log_path() {
  if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
    return std::string(xdg) + "/sonitor/sonitor.log";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.local/state/sonitor/sonitor.log";
  return {};
}

void log_error(const char* component, const char* fmt, ...) {
  std::va_list ap; va_start(ap, fmt); vlog(LogLevel::Error, component, fmt, ap); va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  std::va_list ap; va_start(ap, fmt); vlog(LogLevel::Warn, component, fmt, ap); va_end(ap);
}

void log_info(const char* component, const char* fmt, ...) {
  std::va_list ap; va_start(ap, fmt); vlog(LogLevel::Info, component, fmt, ap); va_end(ap);
}

void log_debug(const char* component, const char* fmt, ...) {
  std::va_list ap; va_start(ap, fmt); vlog(LogLevel::Debug, component, fmt, ap); va_end(ap);
}

} // namespace sonitor::util
