// Helpers for reading /proc, /sys and /etc with optional root remap
#pragma once
#include <string>
#include <vector>
#include <optional>

namespace lanprobe::util {

// Map an absolute /proc path to an alternate root if LANPROBE_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if LANPROBE_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Map an absolute /etc path to an alternate root if LANPROBE_ETC_ROOT is set
auto map_etc_path(const std::string& abs) -> std::string;

// Apply whichever of the above matches the path prefix.
auto map_path(const std::string& abs) -> std::string;

// True when /proc or /sys is remapped (fixture mode).
auto remapped() -> bool;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read the first line with surrounding whitespace removed (sysfs attributes).
auto read_attr(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only, sorted). Returns std::nullopt if the directory cannot be opened.
auto list_dir(const std::string& abs) -> std::optional<std::vector<std::string>>;

auto path_exists(const std::string& abs) -> bool;

} // namespace lanprobe::util
