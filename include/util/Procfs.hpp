// Helpers for reading /proc with optional root remap
#pragma once
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace seagreen::util {

// Map an absolute /proc path to an alternate root if SEAGREEN_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Same, but leaves the failing errno in ec so callers can tell a vanished
// entry (ENOENT/ESRCH) from a refused one (EACCES/EPERM).
auto read_file_string(const std::string& abs, std::error_code& ec) -> std::optional<std::string>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

} // namespace seagreen::util
