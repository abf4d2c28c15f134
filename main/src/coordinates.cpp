#include "coordinates.hpp"
#include "localization.hpp"

#include <array>
#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace {
    constexpr std::string_view SNAPSHOT_SUFFIX = "-SNAPSHOT";
    constexpr std::array<std::string_view, 4> CHECKSUM_SUFFIXES = {".md5", ".sha1", ".sha256", ".sha512"};
    constexpr std::string_view SIGNATURE_SUFFIX = ".asc";

    std::vector<std::string> split_path(const std::string& path) {
        std::vector<std::string> segments;
        std::stringstream ss(path);
        std::string segment;
        while (std::getline(ss, segment, '/')) {
            segments.push_back(segment);
        }
        return segments;
    }

    std::string join(const std::vector<std::string>& parts, size_t count, char separator) {
        std::string out;
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) out += separator;
            out += parts[i];
        }
        return out;
    }

    // Strips checksum and signature suffixes; returns the outermost one.
    std::optional<std::string> strip_side_suffix(std::string& filename) {
        std::optional<std::string> outermost;
        bool stripped = true;
        while (stripped) {
            stripped = false;
            for (std::string_view suffix : CHECKSUM_SUFFIXES) {
                if (filename.size() > suffix.size() && filename.ends_with(suffix)) {
                    if (!outermost) outermost = std::string(suffix.substr(1));
                    filename.erase(filename.size() - suffix.size());
                    stripped = true;
                }
            }
            if (filename.size() > SIGNATURE_SUFFIX.size() && filename.ends_with(SIGNATURE_SUFFIX)) {
                if (!outermost) outermost = std::string(SIGNATURE_SUFFIX.substr(1));
                filename.erase(filename.size() - SIGNATURE_SUFFIX.size());
                stripped = true;
            }
        }
        return outermost;
    }
}

std::string ArtifactCoordinates::group_path() const {
    std::string path = group_id;
    for (char& c : path) {
        if (c == '.') c = '/';
    }
    return path;
}

std::string ArtifactCoordinates::artifact_path() const {
    return group_path() + "/" + artifact_id;
}

std::string ArtifactCoordinates::version_path() const {
    return artifact_path() + "/" + version;
}

RepositoryPath parse_repository_path(std::string_view input) {
    static const std::regex segment_regex(R"(^[A-Za-z0-9._-]+$)");
    static const std::regex metadata_regex(R"(^maven-metadata\.xml(?:\.(md5|sha1|sha256|sha512))?$)");
    static const std::regex snapshot_tail_regex(R"(^(\d{8}\.\d{6}-\d+)(.*)$)");

    RepositoryPath result;
    std::string path(input);
    while (path.starts_with("/")) {
        path.erase(0, 1);
    }
    result.path = path;

    if (path.empty() || path.find("//") != std::string::npos) {
        result.problem = string_format("warning.path_malformed", path);
        return result;
    }
    std::vector<std::string> segments = split_path(path);
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (segments[i] == ".." || segments[i] == "." || !std::regex_match(segments[i], segment_regex)) {
            result.problem = string_format("warning.path_malformed", path);
            return result;
        }
    }

    const std::string& filename = segments.back();
    std::smatch metadata_match;
    if (std::regex_match(filename, metadata_match, metadata_regex)) {
        if (segments.size() < 2) {
            result.problem = string_format("warning.path_malformed", path);
            return result;
        }
        result.kind = PathKind::Metadata;
        result.metadata_dir = join(segments, segments.size() - 1, '/');
        if (metadata_match[1].matched) {
            result.side_extension = metadata_match[1].str();
        }
        return result;
    }

    if (segments.size() < 4) {
        result.problem = string_format("warning.path_layout", path);
        return result;
    }

    const size_t n = segments.size();
    const std::string& artifact_id = segments[n - 3];
    const std::string& version = segments[n - 2];
    std::string base = filename;
    result.side_extension = strip_side_suffix(base);

    ArtifactCoordinates& coords = result.coordinates;
    coords.group_id = join(segments, n - 3, '.');
    coords.artifact_id = artifact_id;
    coords.version = version;

    std::optional<std::string> rest;
    const std::string expected = artifact_id + "-" + version;
    // A '.' followed by a digit continues the version (foo-1.2.3 under 1.2), not the extension.
    auto ends_version = [&](size_t pos) {
        if (pos == base.size() || base[pos] == '-') {
            return true;
        }
        return base[pos] == '.' && !(pos + 1 < base.size() && std::isdigit(static_cast<unsigned char>(base[pos + 1])));
    };
    if (base.starts_with(expected) && ends_version(expected.size())) {
        rest = base.substr(expected.size());
    } else if (is_snapshot_version(version)) {
        std::string stem = version.substr(0, version.size() - SNAPSHOT_SUFFIX.size());
        std::string timestamped_prefix = artifact_id + "-" + stem + "-";
        if (base.starts_with(timestamped_prefix)) {
            std::string tail = base.substr(timestamped_prefix.size());
            std::smatch tail_match;
            if (std::regex_match(tail, tail_match, snapshot_tail_regex)) {
                coords.snapshot_value = stem + "-" + tail_match[1].str();
                rest = tail_match[2].str();
            }
        }
    }

    if (!rest) {
        if (!base.starts_with(artifact_id + "-")) {
            result.problem = string_format("warning.path_artifact_mismatch", path, artifact_id);
        } else {
            result.problem = string_format("warning.path_version_mismatch", path, version);
        }
        return result;
    }

    if (rest->starts_with("-")) {
        size_t dot = rest->find('.');
        if (dot == std::string::npos || dot == 1) {
            result.problem = string_format("warning.path_no_extension", path);
            return result;
        }
        coords.classifier = rest->substr(1, dot - 1);
        coords.extension = rest->substr(dot + 1);
    } else if (rest->starts_with(".")) {
        coords.extension = rest->substr(1);
    }

    if (coords.extension.empty()) {
        result.problem = string_format("warning.path_no_extension", path);
        return result;
    }

    result.kind = PathKind::Artifact;
    return result;
}

bool is_checksum_path(std::string_view path) {
    for (std::string_view suffix : CHECKSUM_SUFFIXES) {
        if (path.ends_with(suffix)) {
            return true;
        }
    }
    return false;
}

bool is_signature_path(std::string_view path) {
    return path.ends_with(SIGNATURE_SUFFIX);
}

bool is_snapshot_version(std::string_view version) {
    return version.size() > SNAPSHOT_SUFFIX.size() && version.ends_with(SNAPSHOT_SUFFIX);
}

bool is_plugin_artifact(std::string_view artifact_id) {
    return artifact_id.find("maven-plugin") != std::string_view::npos || artifact_id.ends_with("-plugin");
}

std::string plugin_prefix(std::string_view artifact_id) {
    std::string prefix(artifact_id);
    if (prefix.ends_with("-maven-plugin")) {
        prefix.erase(prefix.size() - std::string_view("-maven-plugin").size());
        return prefix;
    }
    if (prefix.starts_with("maven-")) {
        prefix.erase(0, std::string_view("maven-").size());
    }
    if (prefix.ends_with("-plugin")) {
        prefix.erase(prefix.size() - std::string_view("-plugin").size());
    }
    return prefix;
}
