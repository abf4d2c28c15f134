#pragma once

#include "coordinates.hpp"
#include "metadata.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

class ArchiveCache;
class StagingList;

// Derives checksum side files and maven-metadata.xml files from staged writes.
// All derived files go through the same cache and staging list as the write
// that triggered them. Failures are logged and never propagate.
class ArtifactPipeline {
public:
    ArtifactPipeline(ArchiveCache& cache, StagingList& staging, std::chrono::system_clock::time_point session_time);

    void process(const std::string& path, const std::string& content);

    const std::string& last_updated() const { return last_updated_; }

private:
    struct SnapshotState {
        std::string timestamp;
        int build_number = 0;
        std::map<std::pair<std::optional<std::string>, std::string>, SnapshotVersionEntry> entries;
    };

    void run_step(const std::string& path, const std::function<void()>& step);
    void stage(const std::string& path, std::string content);
    void stage_checksums(const std::string& path, const std::string& content);
    void stage_with_checksums(const std::string& path, std::string content);
    std::optional<ParsedMetadata> cached_metadata(const std::string& path) const;

    void update_artifact_metadata(const ArtifactCoordinates& coords);
    void update_group_metadata(const ArtifactCoordinates& coords);
    void update_version_metadata(const ArtifactCoordinates& coords);

    ArchiveCache& cache_;
    StagingList& staging_;
    std::string last_updated_;
    std::string snapshot_timestamp_;
    std::map<std::string, std::set<std::string>> versions_;
    std::map<std::string, std::vector<PluginEntry>> plugins_;
    std::map<std::string, SnapshotState> snapshots_;
};
