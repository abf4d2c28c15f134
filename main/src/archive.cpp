#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <ctime>
#include <memory>

namespace {
    // Custom deleters for libarchive handles
    struct ArchiveReadDeleter {
        void operator()(struct archive* a) const {
            if (a) {
                archive_read_close(a);
                archive_read_free(a);
            }
        }
    };

    struct ArchiveWriteDeleter {
        void operator()(struct archive* a) const {
            if (a) {
                archive_write_free(a);
            }
        }
    };

    struct ArchiveEntryDeleter {
        void operator()(struct archive_entry* entry) const {
            if (entry) {
                archive_entry_free(entry);
            }
        }
    };

    using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
    using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
    using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

    std::string archive_error(struct archive* a, const std::string& fallback_key) {
        const char* err = archive_error_string(a);
        return err ? err : get_string(fallback_key);
    }
}

std::map<std::string, std::string> read_zip_entries(const fs::path& archive_path) {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw CacheException(string_format("error.open_file_failed", archive_path.string()));
    }
    archive_read_support_format_zip(a.get());

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw CacheException(string_format("error.archive_corrupt", archive_path.string()) + ": " +
                             archive_error(a.get(), "error.unknown"));
    }

    std::map<std::string, std::string> entries;
    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw CacheException(string_format("error.archive_corrupt", archive_path.string()) + ": " +
                                 archive_error(a.get(), "error.fatal_read"));
        }
        if (r == ARCHIVE_WARN) {
            log_warning(archive_error(a.get(), "error.unknown"));
        }

        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        const char* entry_path = archive_entry_pathname(entry);
        if (!entry_path) continue;

        std::string path = entry_path;
        // Remove leading ./ if present
        if (path.starts_with("./")) path = path.substr(2);
        while (path.starts_with("/")) path.erase(0, 1);
        if (path.empty()) continue;

        std::string content;
        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
            content.reserve(static_cast<size_t>(archive_entry_size(entry)));
        }
        char buffer[8192];
        while (true) {
            la_ssize_t n = archive_read_data(a.get(), buffer, sizeof(buffer));
            if (n == 0) break;
            if (n < 0) {
                throw CacheException(string_format("error.archive_corrupt", archive_path.string()) + ": " +
                                     archive_error(a.get(), "error.data_block_read"));
            }
            content.append(buffer, static_cast<size_t>(n));
        }
        entries[path] = std::move(content);
    }
    return entries;
}

void write_zip_entries(const fs::path& archive_path, const std::map<std::string, std::string>& entries) {
    ensure_dir_exists(archive_path.parent_path());
    fs::path tmp_path = archive_path.string() + ".tmp";

    {
        ArchiveWriteHandle a(archive_write_new());
        if (!a) {
            throw CacheException(string_format("error.create_file_failed", tmp_path.string()));
        }
        archive_write_set_format_zip(a.get());
        archive_write_zip_set_compression_deflate(a.get());

        if (archive_write_open_filename(a.get(), tmp_path.c_str()) != ARCHIVE_OK) {
            throw CacheException(string_format("error.create_file_failed", tmp_path.string()) + ": " +
                                 archive_error(a.get(), "error.unknown"));
        }

        const std::time_t now = std::time(nullptr);
        for (const auto& [path, content] : entries) {
            ArchiveEntryHandle entry(archive_entry_new());
            archive_entry_set_pathname(entry.get(), path.c_str());
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(content.size()));
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_mtime(entry.get(), now, 0);

            if (archive_write_header(a.get(), entry.get()) != ARCHIVE_OK) {
                throw CacheException(string_format("error.archive_write_failed", path) + ": " +
                                     archive_error(a.get(), "error.fatal_write"));
            }
            if (!content.empty() &&
                archive_write_data(a.get(), content.data(), content.size()) != static_cast<la_ssize_t>(content.size())) {
                throw CacheException(string_format("error.archive_write_failed", path) + ": " +
                                     archive_error(a.get(), "error.data_block_write"));
            }
        }

        if (archive_write_close(a.get()) != ARCHIVE_OK) {
            throw CacheException(string_format("error.archive_write_failed", tmp_path.string()) + ": " +
                                 archive_error(a.get(), "error.fatal_write"));
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, archive_path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw CacheException(string_format("error.write_file_failed", archive_path.string()));
    }
}

ArchiveDirectory::ArchiveDirectory(fs::path archive_path) : archive_path_(std::move(archive_path)) {
    if (fs::exists(archive_path_)) {
        entries_ = read_zip_entries(archive_path_);
    }
}

std::optional<std::string> ArchiveDirectory::read(std::string_view path) const {
    auto it = entries_.find(std::string(path));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ArchiveDirectory::write(std::string_view path, std::string content) {
    entries_[std::string(path)] = std::move(content);
    dirty_ = true;
}

bool ArchiveDirectory::exists(std::string_view path) const {
    return entries_.contains(std::string(path));
}

std::vector<std::string> ArchiveDirectory::list(std::string_view prefix) const {
    std::vector<std::string> names;
    for (auto it = entries_.lower_bound(std::string(prefix)); it != entries_.end(); ++it) {
        if (!it->first.starts_with(prefix)) {
            break;
        }
        names.push_back(it->first);
    }
    return names;
}

void ArchiveDirectory::flush() {
    if (!dirty_) {
        return;
    }
    write_zip_entries(archive_path_, entries_);
    dirty_ = false;
}
