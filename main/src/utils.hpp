#pragma once

#include "exception.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_BLUE = "\033[1;34m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_debug(std::string_view msg);

void set_verbose_mode(bool enable);
// Suppresses log_info, for commands that write payload to stdout.
void set_quiet_mode(bool enable);

// Exclusive advisory lock on a sidecar file, held for the lifetime of the object.
// Throws CacheException if another handle already holds it.
class FileLock {
public:
    explicit FileLock(const fs::path& lock_file);
    ~FileLock();
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::string read_file_bytes(const fs::path& path);
// Writes to "<path>.tmp" and renames over path.
void write_file_atomic(const fs::path& path, std::string_view content);

// Strips leading '/' and rejects empty, "..", and "//" paths.
std::string normalize_resource_path(std::string_view path);

std::string trim(std::string_view value);
std::string to_lower(std::string_view value);

// UTC time formatting, e.g. "%Y%m%d%H%M%S".
std::string format_utc(std::chrono::system_clock::time_point time, const char* pattern);
// Parses an ISO-8601 instant such as "2024-01-31T12:00:00Z". Returns false if malformed.
bool parse_iso8601(std::string_view text, std::chrono::system_clock::time_point& out);
