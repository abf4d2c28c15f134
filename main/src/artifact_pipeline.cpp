#include "artifact_pipeline.hpp"
#include "archive_cache.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <charconv>

namespace {
    constexpr std::array<DigestAlgorithm, 3> CHECKSUM_ALGORITHMS = {
        DigestAlgorithm::Md5, DigestAlgorithm::Sha1, DigestAlgorithm::Sha256};

    std::string metadata_path(const std::string& dir) {
        return dir + "/" + std::string(METADATA_FILENAME);
    }
}

ArtifactPipeline::ArtifactPipeline(ArchiveCache& cache, StagingList& staging,
                                   std::chrono::system_clock::time_point session_time)
    : cache_(cache),
      staging_(staging),
      last_updated_(format_utc(session_time, "%Y%m%d%H%M%S")),
      snapshot_timestamp_(format_utc(session_time, "%Y%m%d.%H%M%S")) {}

void ArtifactPipeline::process(const std::string& path, const std::string& content) {
    RepositoryPath parsed = parse_repository_path(path);
    if (parsed.is_side_file()) {
        return;
    }

    run_step(path, [&]() { stage_checksums(parsed.path, content); });

    if (parsed.kind == PathKind::Metadata) {
        return;
    }
    if (parsed.kind == PathKind::Unrecognized) {
        log_warning(parsed.problem);
        return;
    }

    const ArtifactCoordinates& coords = parsed.coordinates;
    run_step(path, [&]() { update_artifact_metadata(coords); });
    if (is_plugin_artifact(coords.artifact_id)) {
        run_step(path, [&]() { update_group_metadata(coords); });
    }
    if (is_snapshot_version(coords.version)) {
        run_step(path, [&]() { update_version_metadata(coords); });
    }
}

void ArtifactPipeline::run_step(const std::string& path, const std::function<void()>& step) {
    try {
        step();
    } catch (const std::exception& e) {
        log_warning(string_format("warning.derived_failed", path, e.what()));
    }
}

void ArtifactPipeline::stage(const std::string& path, std::string content) {
    cache_.write(path, std::move(content));
    staging_.add(path);
}

void ArtifactPipeline::stage_checksums(const std::string& path, const std::string& content) {
    for (DigestAlgorithm algorithm : CHECKSUM_ALGORITHMS) {
        stage(path + "." + std::string(digest_extension(algorithm)), calculate_digest(algorithm, content));
    }
}

void ArtifactPipeline::stage_with_checksums(const std::string& path, std::string content) {
    stage_checksums(path, content);
    stage(path, std::move(content));
}

std::optional<ParsedMetadata> ArtifactPipeline::cached_metadata(const std::string& path) const {
    auto content = cache_.read(path);
    if (!content) {
        return std::nullopt;
    }
    try {
        return parse_metadata(*content);
    } catch (const GhrelException& e) {
        log_warning(string_format("warning.metadata_unreadable", path, e.what()));
        return std::nullopt;
    }
}

void ArtifactPipeline::update_artifact_metadata(const ArtifactCoordinates& coords) {
    const std::string dir = coords.artifact_path();
    auto [it, inserted] = versions_.try_emplace(dir);
    if (inserted) {
        if (auto existing = cached_metadata(metadata_path(dir))) {
            it->second.insert(existing->versions.begin(), existing->versions.end());
        }
    }
    it->second.insert(coords.version);

    std::vector<std::string> versions(it->second.begin(), it->second.end());
    stage_with_checksums(metadata_path(dir),
                         generate_artifact_metadata(coords.group_id, coords.artifact_id, versions, last_updated_));
}

void ArtifactPipeline::update_group_metadata(const ArtifactCoordinates& coords) {
    const std::string dir = coords.group_path();
    auto [it, inserted] = plugins_.try_emplace(dir);
    if (inserted) {
        if (auto existing = cached_metadata(metadata_path(dir))) {
            it->second = existing->plugins;
        }
    }

    std::vector<PluginEntry>& plugins = it->second;
    bool known = std::any_of(plugins.begin(), plugins.end(),
                             [&](const PluginEntry& p) { return p.artifact_id == coords.artifact_id; });
    if (!known) {
        plugins.push_back(PluginEntry{coords.artifact_id, plugin_prefix(coords.artifact_id), coords.artifact_id});
    }
    stage_with_checksums(metadata_path(dir), generate_group_metadata(plugins));
}

void ArtifactPipeline::update_version_metadata(const ArtifactCoordinates& coords) {
    const std::string dir = coords.version_path();
    const std::string stem = coords.version.substr(0, coords.version.size() - std::string_view("-SNAPSHOT").size());
    auto [it, inserted] = snapshots_.try_emplace(dir);
    SnapshotState& state = it->second;

    std::string value;
    if (coords.snapshot_value) {
        // "<stem>-<yyyyMMdd.HHmmss>-<build>"
        value = *coords.snapshot_value;
        std::string tail = value.substr(stem.size() + 1);
        size_t dash = tail.rfind('-');
        int build = 0;
        auto res = std::from_chars(tail.data() + dash + 1, tail.data() + tail.size(), build);
        if (res.ec != std::errc()) {
            build = 0;
        }
        if (!inserted && build != state.build_number) {
            state.entries.clear();
        }
        state.timestamp = tail.substr(0, dash);
        state.build_number = build;
    } else {
        if (inserted) {
            int previous = 0;
            if (auto existing = cached_metadata(metadata_path(dir))) {
                previous = existing->build_number.value_or(0);
            }
            state.timestamp = snapshot_timestamp_;
            state.build_number = previous + 1;
        }
        value = stem + "-" + state.timestamp + "-" + std::to_string(state.build_number);
    }

    SnapshotVersionEntry entry{coords.classifier, coords.extension, value, last_updated_};
    state.entries[{coords.classifier, coords.extension}] = entry;

    SnapshotInfo info;
    info.timestamp = state.timestamp;
    info.build_number = state.build_number;
    for (const auto& [key, snapshot_entry] : state.entries) {
        info.entries.push_back(snapshot_entry);
    }
    stage_with_checksums(metadata_path(dir),
                         generate_version_metadata(coords.group_id, coords.artifact_id, coords.version, info, last_updated_));
}
