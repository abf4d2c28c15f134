#include "endpoint.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"

#include <regex>

std::string RepositoryEndpoint::repository() const {
    return owner + "/" + repo;
}

std::string RepositoryEndpoint::canonical() const {
    return scheme + "://" + owner + "/" + repo + "/" + tag + "/" + asset_name;
}

std::string RepositoryEndpoint::cache_key() const {
    return calculate_digest(DigestAlgorithm::Sha1, canonical());
}

RepositoryEndpoint parse_endpoint(std::string_view uri) {
    static const std::regex endpoint_regex(R"(^([A-Za-z][A-Za-z0-9+.-]*)://([^/]+)/([^/]+)/([^/]+)/([^/]+\.zip)$)");
    std::string text(uri);
    std::smatch match;
    if (!std::regex_match(text, match, endpoint_regex)) {
        throw ConfigurationException(string_format("error.invalid_endpoint", text));
    }
    RepositoryEndpoint endpoint;
    endpoint.scheme = match[1];
    endpoint.owner = match[2];
    endpoint.repo = match[3];
    endpoint.tag = match[4];
    endpoint.asset_name = match[5];
    if (endpoint.asset_name == ".zip") {
        throw ConfigurationException(string_format("error.invalid_endpoint", text));
    }
    return endpoint;
}
