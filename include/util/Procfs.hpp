// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace sonitor::util {

// Map an absolute /proc path to an alternate root if SONITOR_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if SONITOR_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Apply whichever of the two mappings matches the path prefix.
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the leading integer of a file (sysfs style "12345\n").
auto read_file_int(const std::string& abs) -> std::optional<long long>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace sonitor::util
