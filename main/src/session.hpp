#pragma once

#include "archive_cache.hpp"
#include "artifact_pipeline.hpp"
#include "config.hpp"
#include "endpoint.hpp"
#include "http.hpp"
#include "release_client.hpp"
#include "resilience.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One open/close cycle against one endpoint. Writes are collected in the
// local archive and published as a single asset on close().
class RepositorySession {
public:
    RepositorySession(const Settings& settings, HttpTransport& transport, ResilientExecutor& executor, Clock& clock);
    ~RepositorySession();
    RepositorySession(const RepositorySession&) = delete;
    RepositorySession& operator=(const RepositorySession&) = delete;

    void open(std::string_view endpoint_uri, const std::string& credential);
    bool is_open() const { return cache_ != nullptr; }

    std::optional<std::string> read_resource(std::string_view path) const;
    void write_resource(std::string_view path, std::string content);
    bool resource_exists(std::string_view path) const;
    std::vector<std::string> list_resources(std::string_view prefix) const;

    // Publishes staged changes and releases the cache. On failure the cache
    // and staging list are kept and close() may be called again.
    void close();

    // True if the remote asset changed after `since`, or its timestamp is unreadable.
    bool is_remote_newer(std::chrono::system_clock::time_point since);
    // Re-downloads the archive when the remote asset is newer than the local copy.
    bool refresh_if_newer();

    const StagingList& staged() const { return staging_; }
    const RepositoryEndpoint& endpoint() const;
    const fs::path& archive_path() const;

private:
    void require_open() const;

    Settings settings_;
    HttpTransport& transport_;
    ResilientExecutor& executor_;
    Clock& clock_;
    std::unique_ptr<RepositoryEndpoint> endpoint_;
    std::unique_ptr<ReleaseClient> client_;
    std::unique_ptr<ArchiveCache> cache_;
    std::unique_ptr<ArtifactPipeline> pipeline_;
    StagingList staging_;
};
