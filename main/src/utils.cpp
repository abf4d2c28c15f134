#include "utils.hpp"

#include "localization.hpp"

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {
    bool verbose_mode = false;
    bool quiet_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    if (quiet_mode) {
        return;
    }
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_debug(std::string_view msg) {
    if (!verbose_mode) {
        return;
    }
    log_internal(get_string("debug.prefix") + " ", COLOR_BLUE, msg, std::cerr);
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

void set_quiet_mode(bool enable) {
    quiet_mode = enable;
}

FileLock::FileLock(const fs::path& lock_file) : path_(lock_file) {
    ensure_dir_exists(path_.parent_path());
    lock_fd = open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw CacheException(string_format("error.create_file_failed", path_.string()) + ": " + strerror(errno));
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw CacheException(string_format("error.cache_locked", path_.string()));
        }
        throw CacheException(string_format("error.cache_lock_failed", path_.string()) + ": " + strerror(err));
    }
}

FileLock::~FileLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (path.empty()) {
        return;
    }
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw CacheException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    } else if (!fs::is_directory(path)) {
        throw CacheException(string_format("error.path_not_dir", path.string()));
    }
}

std::string read_file_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CacheException(string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw CacheException(string_format("error.read_file_failed", path.string()));
    }
    return buffer.str();
}

void write_file_atomic(const fs::path& path, std::string_view content) {
    ensure_dir_exists(path.parent_path());
    fs::path tmp_path = path.string() + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw CacheException(string_format("error.create_file_failed", tmp_path.string()));
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            throw CacheException(string_format("error.write_file_failed", tmp_path.string()));
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw CacheException(string_format("error.write_file_failed", path.string()));
    }
}

std::string normalize_resource_path(std::string_view path) {
    std::string normalized(path);
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    size_t start = normalized.find_first_not_of('/');
    if (start == std::string::npos) {
        throw GhrelException(string_format("error.invalid_resource_path", std::string(path)));
    }
    normalized.erase(0, start);

    if (normalized.find("//") != std::string::npos) {
        throw GhrelException(string_format("error.invalid_resource_path", std::string(path)));
    }
    std::stringstream segments(normalized);
    std::string segment;
    while (std::getline(segments, segment, '/')) {
        if (segment == "..") {
            throw GhrelException(string_format("error.path_traversal", std::string(path)));
        }
    }
    return normalized;
}

std::string trim(std::string_view value) {
    size_t first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return "";
    }
    size_t last = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(first, last - first + 1));
}

std::string to_lower(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string format_utc(std::chrono::system_clock::time_point time, const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, pattern);
    return out.str();
}

bool parse_iso8601(std::string_view text, std::chrono::system_clock::time_point& out) {
    std::tm tm{};
    std::istringstream in{std::string(text)};
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return false;
    }
    std::string rest;
    in >> rest;
    // Fractional seconds are ignored; only UTC designators are accepted.
    if (!rest.empty() && rest.front() == '.') {
        size_t end = rest.find_first_not_of("0123456789", 1);
        rest = end == std::string::npos ? "" : rest.substr(end);
    }
    if (!rest.empty() && rest != "Z" && rest != "+00:00") {
        return false;
    }
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(t);
    return true;
}
