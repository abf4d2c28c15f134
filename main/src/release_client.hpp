#pragma once

#include "config.hpp"
#include "endpoint.hpp"
#include "http.hpp"
#include "resilience.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

struct RemoteRelease {
    std::string release_id;
    std::string tag_name;
    // Commit the release's tag was ensured at; empty when only looked up.
    std::string commit_sha;
};

struct RemoteAsset {
    std::string asset_id;
    std::string name;
    std::string release_id;
    std::string updated_at;
};

// Sends request through send_once and follows 301/302/303/307/308 responses
// by hand, at most max_redirects times. The Authorization header is dropped
// when a redirect leaves the original host unless forward_credentials is set.
// Throws TooManyRedirectsException on the (max_redirects + 1)-th redirect.
HttpResponse follow_redirects(HttpRequest request, int max_redirects, bool forward_credentials,
                              const std::function<HttpResponse(const HttpRequest&)>& send_once,
                              const std::string& operation, const std::string& resource);

// Tag, release and asset operations against the GitHub REST API.
// Every lookup is a fresh remote call; nothing is cached between operations.
class ReleaseClient {
public:
    ReleaseClient(HttpTransport& transport, ResilientExecutor& executor, const Settings& settings, std::string token);

    std::string get_default_branch(const std::string& repository);
    std::string get_branch_head(const std::string& repository, const std::string& branch);

    // Commit the tag points at, if the tag exists.
    std::optional<std::string> find_tag(const std::string& repository, const std::string& tag);
    std::string ensure_tag(const std::string& repository, const std::string& tag, const std::string& commit_sha);

    std::optional<RemoteRelease> find_release(const std::string& repository, const std::string& tag);
    RemoteRelease ensure_release(const std::string& repository, const std::string& tag, const std::string& commit_sha = "");

    std::vector<RemoteAsset> list_assets(const std::string& repository, const std::string& release_id);
    std::optional<RemoteAsset> find_asset(const std::string& repository, const std::string& release_id, const std::string& name);
    void delete_asset(const std::string& repository, const std::string& asset_id);
    // A 422 conflict is resolved by one delete of the existing asset and one retried upload.
    RemoteAsset upload_asset(const std::string& repository, const RemoteRelease& release,
                             const std::string& name, const std::string& content);

    // The asset named by the endpoint, or nullopt if its release or the asset is missing.
    std::optional<RemoteAsset> find_endpoint_asset(const RepositoryEndpoint& endpoint);
    std::optional<std::string> download_asset(const RepositoryEndpoint& endpoint);

    // default branch -> head commit -> tag -> release -> asset
    RemoteAsset publish(const RepositoryEndpoint& endpoint, const std::string& content);

private:
    HttpRequest make_request(const std::string& method, const std::string& url) const;
    HttpResponse send(const std::string& operation, const std::string& resource, HttpRequest request);
    std::string repo_url(const std::string& repository) const;

    HttpTransport& transport_;
    ResilientExecutor& executor_;
    std::string api_endpoint_;
    std::string upload_endpoint_;
    int max_redirects_;
    bool forward_credentials_;
    std::string token_;
};
