#include "archive_cache.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "release_client.hpp"

void StagingList::add(const std::string& path) {
    if (seen_.insert(path).second) {
        paths_.push_back(path);
    }
}

void StagingList::clear() {
    paths_.clear();
    seen_.clear();
}

ArchiveCache::ArchiveCache(fs::path cache_dir, RepositoryEndpoint endpoint, ReleaseClient& remote)
    : cache_dir_(std::move(cache_dir)),
      endpoint_(std::move(endpoint)),
      remote_(remote),
      archive_path_(cache_dir_ / endpoint_.cache_key()) {}

ArchiveCache::~ArchiveCache() {
    if (!is_open()) {
        return;
    }
    try {
        close();
    } catch (const std::exception& e) {
        log_error(string_format("error.cache_close_failed", archive_path_.string(), e.what()));
    }
}

void ArchiveCache::open() {
    if (is_open()) {
        return;
    }
    ensure_dir_exists(cache_dir_);
    auto lock = std::make_unique<FileLock>(fs::path(archive_path_.string() + ".lock"));

    if (!fs::exists(archive_path_)) {
        fetch_remote();
    } else {
        log_debug(string_format("debug.cache_hit", endpoint_.canonical(), archive_path_.string()));
    }

    directory_ = std::make_unique<ArchiveDirectory>(archive_path_);
    lock_ = std::move(lock);
}

void ArchiveCache::fetch_remote() {
    log_info(string_format("info.fetching_archive", endpoint_.canonical()));
    auto content = remote_.download_asset(endpoint_);
    if (!content) {
        log_info(string_format("info.remote_archive_absent", endpoint_.canonical()));
        return;
    }
    write_file_atomic(archive_path_, *content);
}

const ArchiveDirectory& ArchiveCache::directory() const {
    if (!directory_) {
        throw CacheException(string_format("error.cache_not_open", endpoint_.canonical()));
    }
    return *directory_;
}

ArchiveDirectory& ArchiveCache::directory() {
    if (!directory_) {
        throw CacheException(string_format("error.cache_not_open", endpoint_.canonical()));
    }
    return *directory_;
}

std::optional<std::string> ArchiveCache::read(std::string_view path) const {
    return directory().read(normalize_resource_path(path));
}

void ArchiveCache::write(std::string_view path, std::string content) {
    directory().write(normalize_resource_path(path), std::move(content));
}

bool ArchiveCache::exists(std::string_view path) const {
    return directory().exists(normalize_resource_path(path));
}

std::vector<std::string> ArchiveCache::list(std::string_view prefix) const {
    std::string normalized(prefix);
    while (normalized.starts_with("/")) {
        normalized.erase(0, 1);
    }
    return directory().list(normalized);
}

bool ArchiveCache::has_pending_changes() const {
    return directory_ && directory_->dirty();
}

void ArchiveCache::flush() {
    directory().flush();
}

void ArchiveCache::close() {
    if (!is_open()) {
        return;
    }
    directory_->flush();
    directory_.reset();
    lock_.reset();
}

void ArchiveCache::reload_from_remote() {
    if (has_pending_changes()) {
        throw CacheException(string_format("error.reload_with_pending", endpoint_.canonical()));
    }
    if (!is_open()) {
        throw CacheException(string_format("error.cache_not_open", endpoint_.canonical()));
    }
    // Keep the old copy until the new one is in place.
    auto content = remote_.download_asset(endpoint_);
    if (!content) {
        log_info(string_format("info.remote_archive_absent", endpoint_.canonical()));
        return;
    }
    write_file_atomic(archive_path_, *content);
    directory_ = std::make_unique<ArchiveDirectory>(archive_path_);
}
