#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Reads every regular-file entry of a zip archive. Later duplicates win.
// Throws CacheException if the archive is unreadable or corrupted.
std::map<std::string, std::string> read_zip_entries(const fs::path& archive_path);

// Writes entries as a zip to a temporary file and renames it over archive_path.
void write_zip_entries(const fs::path& archive_path, const std::map<std::string, std::string>& entries);

// A zip file viewed as a directory of path -> content entries.
// Changes are held in memory until flush() rewrites the archive.
class ArchiveDirectory {
public:
    // Loads archive_path if it exists; otherwise starts empty.
    explicit ArchiveDirectory(fs::path archive_path);

    std::optional<std::string> read(std::string_view path) const;
    void write(std::string_view path, std::string content);
    bool exists(std::string_view path) const;
    // Entry paths starting with prefix, sorted.
    std::vector<std::string> list(std::string_view prefix) const;

    size_t size() const { return entries_.size(); }
    bool dirty() const { return dirty_; }
    const fs::path& path() const { return archive_path_; }

    void flush();

private:
    fs::path archive_path_;
    std::map<std::string, std::string> entries_;
    bool dirty_ = false;
};
