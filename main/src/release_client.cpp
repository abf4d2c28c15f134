#include "release_client.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <json/json.h>

#include <memory>
#include <sstream>

namespace {
    constexpr const char* API_VERSION = "2022-11-28";
    constexpr const char* USER_AGENT = "ghrel/0.1";
    constexpr int ASSETS_PER_PAGE = 100;

    std::string excerpt(const std::string& body) {
        constexpr size_t limit = 300;
        return body.size() <= limit ? body : body.substr(0, limit) + "...";
    }

    [[noreturn]] void fail(const std::string& operation, const std::string& resource, const HttpResponse& response) {
        throw PermanentException(operation, resource, response.status, excerpt(response.body));
    }

    Json::Value parse_json(const std::string& operation, const std::string& resource, const HttpResponse& response) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errors;
        const char* begin = response.body.data();
        if (!reader->parse(begin, begin + response.body.size(), &root, &errors)) {
            throw PermanentException(operation, resource, response.status,
                                     string_format("error.invalid_json", errors));
        }
        return root;
    }

    std::string to_json(const Json::Value& value) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        return Json::writeString(builder, value);
    }

    std::string json_id(const Json::Value& value) {
        if (value.isString()) {
            return value.asString();
        }
        if (value.isIntegral()) {
            return std::to_string(value.asLargestInt());
        }
        return "";
    }

    std::string require_string(const std::string& operation, const std::string& resource,
                               const HttpResponse& response, const Json::Value& value) {
        std::string text = value.isString() ? value.asString() : json_id(value);
        if (text.empty()) {
            throw PermanentException(operation, resource, response.status,
                                     string_format("error.missing_field", excerpt(response.body)));
        }
        return text;
    }

    RemoteAsset asset_from_json(const Json::Value& item, const std::string& release_id) {
        RemoteAsset asset;
        asset.asset_id = json_id(item["id"]);
        asset.name = item["name"].asString();
        asset.release_id = release_id;
        asset.updated_at = item["updated_at"].asString();
        return asset;
    }
}

HttpResponse follow_redirects(HttpRequest request, int max_redirects, bool forward_credentials,
                              const std::function<HttpResponse(const HttpRequest&)>& send_once,
                              const std::string& operation, const std::string& resource) {
    const std::string origin = url_authority(request.url);
    for (int hop = 0;; ++hop) {
        HttpResponse response = send_once(request);
        if (!response.is_redirect()) {
            return response;
        }
        if (hop >= max_redirects) {
            throw TooManyRedirectsException(operation, resource, response.status,
                                            string_format("error.too_many_redirects", max_redirects));
        }
        auto location = response.header("location");
        if (!location || location->empty()) {
            throw PermanentException(operation, resource, response.status, get_string("error.redirect_no_location"));
        }

        std::string next = resolve_location(request.url, *location);
        if (!forward_credentials && url_authority(next) != origin) {
            request.remove_header("Authorization");
        }
        if (response.status == 303 || ((response.status == 301 || response.status == 302) && request.method == "POST")) {
            request.method = "GET";
            request.body.clear();
            request.remove_header("Content-Type");
        }
        log_debug(string_format("debug.redirect", response.status, next));
        request.url = std::move(next);
    }
}

ReleaseClient::ReleaseClient(HttpTransport& transport, ResilientExecutor& executor, const Settings& settings, std::string token)
    : transport_(transport),
      executor_(executor),
      api_endpoint_(settings.api_endpoint),
      upload_endpoint_(settings.upload_endpoint),
      max_redirects_(settings.max_redirects),
      forward_credentials_(settings.forward_credentials_cross_host),
      token_(std::move(token)) {}

HttpRequest ReleaseClient::make_request(const std::string& method, const std::string& url) const {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.set_header("Accept", "application/vnd.github+json");
    request.set_header("Authorization", "Bearer " + token_);
    request.set_header("X-GitHub-Api-Version", API_VERSION);
    request.set_header("User-Agent", USER_AGENT);
    return request;
}

HttpResponse ReleaseClient::send(const std::string& operation, const std::string& resource, HttpRequest request) {
    return follow_redirects(std::move(request), max_redirects_, forward_credentials_,
        [&](const HttpRequest& hop) {
            return executor_.execute(operation, resource, [&]() { return transport_.perform(hop); });
        },
        operation, resource);
}

std::string ReleaseClient::repo_url(const std::string& repository) const {
    return api_endpoint_ + "/repos/" + repository;
}

std::string ReleaseClient::get_default_branch(const std::string& repository) {
    const std::string operation = "get_default_branch";
    HttpResponse response = send(operation, repository, make_request("GET", repo_url(repository)));
    if (response.status != 200) {
        fail(operation, repository, response);
    }
    Json::Value root = parse_json(operation, repository, response);
    return require_string(operation, repository, response, root["default_branch"]);
}

std::string ReleaseClient::get_branch_head(const std::string& repository, const std::string& branch) {
    const std::string operation = "get_branch_head";
    const std::string resource = repository + "@" + branch;
    HttpResponse response = send(operation, resource,
                                 make_request("GET", repo_url(repository) + "/branches/" + url_encode(branch)));
    if (response.status != 200) {
        fail(operation, resource, response);
    }
    Json::Value root = parse_json(operation, resource, response);
    return require_string(operation, resource, response, root["commit"]["sha"]);
}

std::optional<std::string> ReleaseClient::find_tag(const std::string& repository, const std::string& tag) {
    const std::string operation = "find_tag";
    const std::string resource = repository + "@" + tag;
    HttpResponse response = send(operation, resource,
                                 make_request("GET", repo_url(repository) + "/git/ref/tags/" + url_encode(tag)));
    if (response.status == 404) {
        return std::nullopt;
    }
    if (response.status != 200) {
        fail(operation, resource, response);
    }
    Json::Value root = parse_json(operation, resource, response);
    return require_string(operation, resource, response, root["object"]["sha"]);
}

std::string ReleaseClient::ensure_tag(const std::string& repository, const std::string& tag, const std::string& commit_sha) {
    if (auto existing = find_tag(repository, tag)) {
        log_debug(string_format("debug.tag_exists", tag, *existing));
        return *existing;
    }

    const std::string operation = "create_tag";
    const std::string resource = repository + "@" + tag;
    Json::Value body;
    body["ref"] = "refs/tags/" + tag;
    body["sha"] = commit_sha;
    HttpRequest request = make_request("POST", repo_url(repository) + "/git/refs");
    request.set_header("Content-Type", "application/json");
    request.body = to_json(body);

    HttpResponse response = send(operation, resource, std::move(request));
    if (response.status == 201) {
        log_info(string_format("info.tag_created", tag, commit_sha));
        return commit_sha;
    }
    // Created concurrently since the check.
    if (response.status == 422) {
        if (auto existing = find_tag(repository, tag)) {
            return *existing;
        }
    }
    fail(operation, resource, response);
}

std::optional<RemoteRelease> ReleaseClient::find_release(const std::string& repository, const std::string& tag) {
    const std::string operation = "find_release";
    const std::string resource = repository + "@" + tag;
    HttpResponse response = send(operation, resource,
                                 make_request("GET", repo_url(repository) + "/releases/tags/" + url_encode(tag)));
    if (response.status == 404) {
        return std::nullopt;
    }
    if (response.status != 200) {
        fail(operation, resource, response);
    }
    Json::Value root = parse_json(operation, resource, response);
    RemoteRelease release;
    release.release_id = require_string(operation, resource, response, root["id"]);
    release.tag_name = root.get("tag_name", tag).asString();
    return release;
}

RemoteRelease ReleaseClient::ensure_release(const std::string& repository, const std::string& tag,
                                            const std::string& commit_sha) {
    if (auto existing = find_release(repository, tag)) {
        existing->commit_sha = commit_sha;
        return *existing;
    }

    const std::string operation = "create_release";
    const std::string resource = repository + "@" + tag;
    Json::Value body;
    body["tag_name"] = tag;
    body["name"] = tag;
    body["body"] = string_format("info.release_body", tag);
    body["draft"] = false;
    body["prerelease"] = false;
    if (!commit_sha.empty()) {
        body["target_commitish"] = commit_sha;
    }
    body["generate_release_notes"] = false;
    HttpRequest request = make_request("POST", repo_url(repository) + "/releases");
    request.set_header("Content-Type", "application/json");
    request.body = to_json(body);

    HttpResponse response = send(operation, resource, std::move(request));
    if (response.status == 201) {
        Json::Value root = parse_json(operation, resource, response);
        RemoteRelease release;
        release.release_id = require_string(operation, resource, response, root["id"]);
        release.tag_name = tag;
        release.commit_sha = commit_sha;
        log_info(string_format("info.release_created", tag, release.release_id));
        return release;
    }
    if (response.status == 422) {
        if (auto existing = find_release(repository, tag)) {
            existing->commit_sha = commit_sha;
            return *existing;
        }
    }
    fail(operation, resource, response);
}

std::vector<RemoteAsset> ReleaseClient::list_assets(const std::string& repository, const std::string& release_id) {
    const std::string operation = "list_assets";
    const std::string resource = repository + "#" + release_id;
    std::vector<RemoteAsset> assets;
    for (int page = 1;; ++page) {
        std::string url = repo_url(repository) + "/releases/" + release_id + "/assets?per_page=" +
                          std::to_string(ASSETS_PER_PAGE) + "&page=" + std::to_string(page);
        HttpResponse response = send(operation, resource, make_request("GET", url));
        if (response.status != 200) {
            fail(operation, resource, response);
        }
        Json::Value root = parse_json(operation, resource, response);
        if (!root.isArray()) {
            throw PermanentException(operation, resource, response.status,
                                     string_format("error.missing_field", excerpt(response.body)));
        }
        for (const auto& item : root) {
            assets.push_back(asset_from_json(item, release_id));
        }
        if (root.size() < static_cast<Json::ArrayIndex>(ASSETS_PER_PAGE)) {
            break;
        }
    }
    return assets;
}

std::optional<RemoteAsset> ReleaseClient::find_asset(const std::string& repository, const std::string& release_id,
                                                     const std::string& name) {
    for (auto& asset : list_assets(repository, release_id)) {
        if (asset.name == name) {
            return asset;
        }
    }
    return std::nullopt;
}

void ReleaseClient::delete_asset(const std::string& repository, const std::string& asset_id) {
    const std::string operation = "delete_asset";
    const std::string resource = repository + "#asset/" + asset_id;
    HttpResponse response = send(operation, resource,
                                 make_request("DELETE", repo_url(repository) + "/releases/assets/" + asset_id));
    if (response.status != 204) {
        fail(operation, resource, response);
    }
}

RemoteAsset ReleaseClient::upload_asset(const std::string& repository, const RemoteRelease& release,
                                        const std::string& name, const std::string& content) {
    const std::string operation = "upload_asset";
    const std::string resource = repository + "@" + release.tag_name + "/" + name;
    auto attempt_upload = [&]() {
        HttpRequest request = make_request("POST", upload_endpoint_ + "/repos/" + repository + "/releases/" +
                                                   release.release_id + "/assets?name=" + url_encode(name));
        request.set_header("Content-Type", "application/zip");
        request.body = content;
        return send(operation, resource, std::move(request));
    };

    HttpResponse response = attempt_upload();
    if (response.status == 422) {
        log_warning(string_format("warning.asset_conflict", name));
        if (auto existing = find_asset(repository, release.release_id, name)) {
            delete_asset(repository, existing->asset_id);
        }
        response = attempt_upload();
    }
    if (response.status != 201) {
        fail(operation, resource, response);
    }
    Json::Value root = parse_json(operation, resource, response);
    RemoteAsset asset = asset_from_json(root, release.release_id);
    log_info(string_format("info.asset_uploaded", name, content.size()));
    return asset;
}

std::optional<RemoteAsset> ReleaseClient::find_endpoint_asset(const RepositoryEndpoint& endpoint) {
    auto release = find_release(endpoint.repository(), endpoint.tag);
    if (!release) {
        return std::nullopt;
    }
    return find_asset(endpoint.repository(), release->release_id, endpoint.asset_name);
}

std::optional<std::string> ReleaseClient::download_asset(const RepositoryEndpoint& endpoint) {
    auto asset = find_endpoint_asset(endpoint);
    if (!asset) {
        return std::nullopt;
    }

    const std::string operation = "download_asset";
    const std::string resource = endpoint.canonical();
    HttpRequest request = make_request("GET", repo_url(endpoint.repository()) + "/releases/assets/" + asset->asset_id);
    request.set_header("Accept", "application/octet-stream");
    HttpResponse response = send(operation, resource, std::move(request));
    if (response.status == 404) {
        return std::nullopt;
    }
    if (response.status != 200) {
        fail(operation, resource, response);
    }
    log_info(string_format("info.asset_downloaded", endpoint.asset_name, response.body.size()));
    return std::move(response.body);
}

RemoteAsset ReleaseClient::publish(const RepositoryEndpoint& endpoint, const std::string& content) {
    const std::string repository = endpoint.repository();
    std::string branch = get_default_branch(repository);
    std::string head = get_branch_head(repository, branch);
    std::string tagged = ensure_tag(repository, endpoint.tag, head);
    RemoteRelease release = ensure_release(repository, endpoint.tag, tagged);
    log_debug(string_format("debug.release_ready", release.tag_name, release.release_id, release.commit_sha));
    return upload_asset(repository, release, endpoint.asset_name, content);
}
