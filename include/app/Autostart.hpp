#pragma once
#include <string>

namespace sonitor::app {

// `path` as one quoted argument of a desktop entry Exec= line.
[[nodiscard]] std::string desktop_exec_quote(const std::string& path);

// Text of the XDG autostart desktop entry launching `exec_path`.
[[nodiscard]] std::string autostart_entry(const std::string& exec_path);

// $XDG_CONFIG_HOME/autostart/sonitor.desktop, else
// ~/.config/autostart/sonitor.desktop; empty if neither is set.
[[nodiscard]] std::string autostart_file_path();

// Absolute path of the running binary (/proc/self/exe), empty on failure.
[[nodiscard]] std::string current_executable();

// Write (enabled) or remove (disabled) the autostart entry. Returns false
// and logs when the file system refuses.
bool set_autostart(bool enabled, const std::string& exec_path);
inline bool set_autostart(bool enabled) { return set_autostart(enabled, current_executable()); }

[[nodiscard]] bool autostart_installed();

} // namespace sonitor::app
