#pragma once

#include "archive.hpp"
#include "endpoint.hpp"
#include "utils.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

class ReleaseClient;

// Resource paths touched in a session, in first-touch order, without duplicates.
class StagingList {
public:
    void add(const std::string& path);
    bool contains(const std::string& path) const { return seen_.contains(path); }
    bool empty() const { return paths_.empty(); }
    size_t size() const { return paths_.size(); }
    const std::vector<std::string>& paths() const { return paths_; }
    void clear();

private:
    std::vector<std::string> paths_;
    std::set<std::string> seen_;
};

// The local zip that mirrors one endpoint's remote asset.
// open() takes an exclusive lock and fetches the remote asset when no local
// copy exists; close() flushes pending writes and releases the lock.
class ArchiveCache {
public:
    ArchiveCache(fs::path cache_dir, RepositoryEndpoint endpoint, ReleaseClient& remote);
    ~ArchiveCache();
    ArchiveCache(const ArchiveCache&) = delete;
    ArchiveCache& operator=(const ArchiveCache&) = delete;

    void open();
    bool is_open() const { return directory_ != nullptr; }

    std::optional<std::string> read(std::string_view path) const;
    void write(std::string_view path, std::string content);
    bool exists(std::string_view path) const;
    std::vector<std::string> list(std::string_view prefix) const;

    bool has_pending_changes() const;
    void flush();
    void close();

    // Discards the local copy and fetches the remote asset again.
    void reload_from_remote();

    const fs::path& archive_path() const { return archive_path_; }
    const RepositoryEndpoint& endpoint() const { return endpoint_; }

private:
    void fetch_remote();
    const ArchiveDirectory& directory() const;
    ArchiveDirectory& directory();

    fs::path cache_dir_;
    RepositoryEndpoint endpoint_;
    ReleaseClient& remote_;
    fs::path archive_path_;
    std::unique_ptr<FileLock> lock_;
    std::unique_ptr<ArchiveDirectory> directory_;
};
