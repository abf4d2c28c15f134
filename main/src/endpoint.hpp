#pragma once

#include <string>
#include <string_view>

inline constexpr std::string_view ENDPOINT_SCHEME = "ghrelasset";

// One remote repository: scheme://owner/repo/tag/asset.zip
struct RepositoryEndpoint {
    std::string scheme;
    std::string owner;
    std::string repo;
    std::string tag;
    std::string asset_name;

    // "owner/repo", as used in API paths.
    std::string repository() const;
    std::string canonical() const;
    // Lowercase hex SHA-1 of canonical(); names the local cache file.
    std::string cache_key() const;

    bool operator==(const RepositoryEndpoint&) const = default;
};

// Throws ConfigurationException unless the URI has exactly four non-empty
// segments after "scheme://" and the last one ends in ".zip".
RepositoryEndpoint parse_endpoint(std::string_view uri);
