#pragma once

#include <string>
#include <string_view>

namespace sonitor::util {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Parse "error|warn|info|debug" (case-insensitive); unknown -> def.
[[nodiscard]] LogLevel parse_log_level(std::string_view s, LogLevel def = LogLevel::Warn);

void set_log_level(LogLevel lvl);
[[nodiscard]] LogLevel log_level();

// While a file sink is set, lines are appended there instead of stderr
// (the widget owns the terminal). Empty path restores stderr. Returns false
// if the file cannot be opened; stderr stays active.
bool set_log_file(const std::string& path);

// Default log file: $XDG_STATE_HOME/sonitor/sonitor.log or
// ~/.local/state/sonitor/sonitor.log; empty if neither is set.
[[nodiscard]] std::string default_log_path();

// Each emits "sonitor: <component>: <message>\n" when the level passes.
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace sonitor::util
