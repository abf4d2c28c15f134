#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view METADATA_FILENAME = "maven-metadata.xml";

struct PluginEntry {
    std::string name;
    std::string prefix;
    std::string artifact_id;
};

struct SnapshotVersionEntry {
    std::optional<std::string> classifier;
    std::string extension;
    std::string value;
    std::string updated;
};

struct SnapshotInfo {
    std::string timestamp;  // yyyyMMdd.HHmmss
    int build_number = 1;
    std::vector<SnapshotVersionEntry> entries;
};

// What is recovered from an existing maven-metadata.xml.
struct ParsedMetadata {
    std::vector<std::string> versions;
    std::vector<PluginEntry> plugins;
    std::optional<int> build_number;
    std::optional<std::string> snapshot_timestamp;
};

// The generators are pure: the same arguments always give the same bytes.
// last_updated is yyyyMMddHHmmss (UTC).
std::string generate_artifact_metadata(const std::string& group_id, const std::string& artifact_id,
                                       const std::vector<std::string>& versions, const std::string& last_updated);
std::string generate_group_metadata(const std::vector<PluginEntry>& plugins);
std::string generate_version_metadata(const std::string& group_id, const std::string& artifact_id,
                                      const std::string& version, const SnapshotInfo& snapshot,
                                      const std::string& last_updated);

// Throws GhrelException if xml is not well-formed metadata.
ParsedMetadata parse_metadata(std::string_view xml);
