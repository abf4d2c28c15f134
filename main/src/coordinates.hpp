#pragma once

#include <optional>
#include <string>
#include <string_view>

struct ArtifactCoordinates {
    std::string group_id;      // dotted, e.g. "com.example"
    std::string artifact_id;
    std::string version;
    std::optional<std::string> classifier;
    std::string extension;
    // Set for timestamped snapshot file names, e.g. "1.0-20240101.120000-3".
    std::optional<std::string> snapshot_value;

    std::string group_path() const;
    // "<groupPath>/<artifactId>"
    std::string artifact_path() const;
    // "<groupPath>/<artifactId>/<version>"
    std::string version_path() const;
};

enum class PathKind {
    Artifact,   // <groupPath>/<artifactId>/<version>/<file>
    Metadata,   // <dir>/maven-metadata.xml
    Unrecognized
};

struct RepositoryPath {
    PathKind kind = PathKind::Unrecognized;
    std::string path;
    // Directory holding a maven-metadata.xml file.
    std::string metadata_dir;
    ArtifactCoordinates coordinates;
    // "md5", "sha1", "sha256", "sha512" or "asc" when the path names a side file.
    std::optional<std::string> side_extension;
    // Why decomposition failed, for Unrecognized paths.
    std::string problem;

    bool is_side_file() const { return side_extension.has_value(); }
};

RepositoryPath parse_repository_path(std::string_view path);

bool is_checksum_path(std::string_view path);
bool is_signature_path(std::string_view path);
bool is_snapshot_version(std::string_view version);
bool is_plugin_artifact(std::string_view artifact_id);
// "foo-maven-plugin" -> "foo", "maven-bar-plugin" -> "bar"
std::string plugin_prefix(std::string_view artifact_id);
