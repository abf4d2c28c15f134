#pragma once

#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/http.hpp"
#include "../main/src/resilience.hpp"

#include <json/json.h>

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Deterministic clock: sleeping only advances time and records the request.
class FakeClock : public Clock {
public:
    FakeClock() : current_(std::chrono::sys_days{std::chrono::year{2024} / 6 / 1} + std::chrono::hours(12)) {}

    std::chrono::system_clock::time_point now() const override { return current_; }
    void sleep_for(std::chrono::milliseconds duration) override {
        sleeps.push_back(duration);
        current_ += duration;
    }
    void advance(std::chrono::milliseconds duration) { current_ += duration; }
    long long epoch_seconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(current_.time_since_epoch()).count();
    }

    std::vector<std::chrono::milliseconds> sleeps;

private:
    std::chrono::system_clock::time_point current_;
};

// In-memory stand-in for the GitHub REST API, the upload host and the
// download CDN that asset downloads redirect to.
class FakeGitHub : public HttpTransport {
public:
    struct Asset {
        long id = 0;
        std::string name;
        std::string content;
        std::string updated_at;
    };
    struct Release {
        long id = 0;
        std::string tag;
        std::vector<Asset> assets;
    };

    static constexpr const char* API = "https://api.test";
    static constexpr const char* UPLOADS = "https://uploads.test";
    static constexpr const char* CDN = "https://cdn.test";

    std::string default_branch = "main";
    std::string head_sha = "0123456789abcdef0123456789abcdef01234567";
    std::map<std::string, std::string> tags;
    std::map<std::string, Release> releases;
    std::string asset_timestamp = "2024-06-01T12:00:00Z";

    // Returned (or thrown, for status 0) ahead of normal routing, one per request.
    std::deque<HttpResponse> queued;
    int transient_failures = 0;
    // Answer tag and release creation with 422 although nothing exists yet.
    bool race_on_create = false;
    bool redirect_downloads = true;

    std::vector<HttpRequest> requests;

    HttpResponse perform(const HttpRequest& request) override {
        requests.push_back(request);
        if (transient_failures > 0) {
            --transient_failures;
            throw TransientException(request.method, request.url, 0, "connection reset");
        }
        if (!queued.empty()) {
            HttpResponse response = queued.front();
            queued.pop_front();
            return response;
        }
        return route(request);
    }

    int count(const std::string& method, const std::string& url_fragment) const {
        int n = 0;
        for (const auto& r : requests) {
            if (r.method == method && r.url.find(url_fragment) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    Release& add_release(const std::string& tag) {
        Release& release = releases[tag];
        release.id = next_id_++;
        release.tag = tag;
        tags.emplace(tag, head_sha);
        return release;
    }

    Asset& add_asset(const std::string& tag, const std::string& name, const std::string& content) {
        Release& release = releases.count(tag) ? releases[tag] : add_release(tag);
        Asset asset;
        asset.id = next_id_++;
        asset.name = name;
        asset.content = content;
        asset.updated_at = asset_timestamp;
        release.assets.push_back(asset);
        return release.assets.back();
    }

    const Asset* asset(const std::string& tag, const std::string& name) const {
        auto it = releases.find(tag);
        if (it == releases.end()) {
            return nullptr;
        }
        for (const auto& a : it->second.assets) {
            if (a.name == name) {
                return &a;
            }
        }
        return nullptr;
    }

    static Settings settings(const std::filesystem::path& cache_dir) {
        Settings s;
        s.api_endpoint = API;
        s.upload_endpoint = UPLOADS;
        s.cache_dir = cache_dir;
        s.retry.base_delay = std::chrono::milliseconds(10);
        s.retry.max_delay = std::chrono::milliseconds(100);
        return s;
    }

private:
    static HttpResponse json(long status, const Json::Value& value) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        HttpResponse response;
        response.status = status;
        response.headers["content-type"] = "application/json";
        response.body = Json::writeString(builder, value);
        return response;
    }

    static HttpResponse status_only(long status) {
        HttpResponse response;
        response.status = status;
        return response;
    }

    static Json::Value parse(const std::string& body) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errors;
        reader->parse(body.data(), body.data() + body.size(), &root, &errors);
        return root;
    }

    static std::string query_param(const std::string& query, const std::string& name) {
        size_t pos = query.find(name + "=");
        if (pos == std::string::npos) {
            return "";
        }
        size_t start = pos + name.size() + 1;
        return query.substr(start, query.find('&', start) - start);
    }

    static Json::Value asset_json(const Asset& asset) {
        Json::Value value;
        value["id"] = static_cast<Json::Int64>(asset.id);
        value["name"] = asset.name;
        value["size"] = static_cast<Json::UInt64>(asset.content.size());
        value["updated_at"] = asset.updated_at;
        return value;
    }

    Release* release_by_id(const std::string& id) {
        for (auto& [tag, release] : releases) {
            if (std::to_string(release.id) == id) {
                return &release;
            }
        }
        return nullptr;
    }

    HttpResponse route(const HttpRequest& request) {
        std::string url = request.url;
        std::string query;
        if (size_t q = url.find('?'); q != std::string::npos) {
            query = url.substr(q + 1);
            url = url.substr(0, q);
        }

        if (url.starts_with(CDN)) {
            std::string id = url.substr(std::string(CDN).size() + std::string("/download/").size());
            for (auto& [tag, release] : releases) {
                for (const auto& a : release.assets) {
                    if (std::to_string(a.id) == id) {
                        HttpResponse response;
                        response.status = 200;
                        response.body = a.content;
                        return response;
                    }
                }
            }
            return status_only(404);
        }

        const std::string base = url.starts_with(UPLOADS) ? UPLOADS : API;
        std::string path = url.substr(base.size());
        // "/repos/<owner>/<repo>" then the rest
        size_t repo_end = path.find('/', path.find('/', std::string("/repos/").size()) + 1);
        std::string rest = repo_end == std::string::npos ? "" : path.substr(repo_end);

        if (base == UPLOADS) {
            // /releases/<id>/assets?name=
            std::string id = rest.substr(std::string("/releases/").size());
            id = id.substr(0, id.find('/'));
            Release* release = release_by_id(id);
            if (!release) {
                return status_only(404);
            }
            std::string name = query_param(query, "name");
            for (const auto& a : release->assets) {
                if (a.name == name) {
                    Json::Value error;
                    error["message"] = "Validation Failed";
                    return json(422, error);
                }
            }
            Asset asset;
            asset.id = next_id_++;
            asset.name = name;
            asset.content = request.body;
            asset.updated_at = asset_timestamp;
            release->assets.push_back(asset);
            return json(201, asset_json(asset));
        }

        if (request.method == "GET" && rest.empty()) {
            Json::Value repo;
            repo["default_branch"] = default_branch;
            return json(200, repo);
        }
        if (request.method == "GET" && rest.starts_with("/branches/")) {
            Json::Value branch;
            branch["commit"]["sha"] = head_sha;
            return json(200, branch);
        }
        if (request.method == "GET" && rest.starts_with("/git/ref/tags/")) {
            std::string tag = rest.substr(std::string("/git/ref/tags/").size());
            auto it = tags.find(tag);
            if (it == tags.end()) {
                return status_only(404);
            }
            Json::Value ref;
            ref["ref"] = "refs/tags/" + tag;
            ref["object"]["sha"] = it->second;
            return json(200, ref);
        }
        if (request.method == "POST" && rest == "/git/refs") {
            Json::Value body = parse(request.body);
            std::string tag = body["ref"].asString().substr(std::string("refs/tags/").size());
            if (race_on_create) {
                tags.emplace(tag, body["sha"].asString());
                return status_only(422);
            }
            if (tags.count(tag)) {
                return status_only(422);
            }
            tags[tag] = body["sha"].asString();
            return json(201, body);
        }
        if (request.method == "GET" && rest.starts_with("/releases/tags/")) {
            std::string tag = rest.substr(std::string("/releases/tags/").size());
            auto it = releases.find(tag);
            if (it == releases.end()) {
                return status_only(404);
            }
            Json::Value release;
            release["id"] = static_cast<Json::Int64>(it->second.id);
            release["tag_name"] = tag;
            return json(200, release);
        }
        if (request.method == "POST" && rest == "/releases") {
            Json::Value body = parse(request.body);
            std::string tag = body["tag_name"].asString();
            if (race_on_create) {
                add_release(tag);
                return status_only(422);
            }
            if (releases.count(tag)) {
                return status_only(422);
            }
            Release& release = add_release(tag);
            Json::Value created;
            created["id"] = static_cast<Json::Int64>(release.id);
            created["tag_name"] = tag;
            return json(201, created);
        }
        if (rest.starts_with("/releases/assets/")) {
            std::string id = rest.substr(std::string("/releases/assets/").size());
            for (auto& [tag, release] : releases) {
                for (auto it = release.assets.begin(); it != release.assets.end(); ++it) {
                    if (std::to_string(it->id) != id) {
                        continue;
                    }
                    if (request.method == "DELETE") {
                        release.assets.erase(it);
                        return status_only(204);
                    }
                    if (redirect_downloads) {
                        HttpResponse response;
                        response.status = 302;
                        response.headers["location"] = std::string(CDN) + "/download/" + id;
                        return response;
                    }
                    HttpResponse response;
                    response.status = 200;
                    response.body = it->content;
                    return response;
                }
            }
            return status_only(404);
        }
        if (request.method == "GET" && rest.starts_with("/releases/") && rest.ends_with("/assets")) {
            std::string id = rest.substr(std::string("/releases/").size());
            id = id.substr(0, id.find('/'));
            Release* release = release_by_id(id);
            if (!release) {
                return status_only(404);
            }
            int per_page = std::stoi(query_param(query, "per_page"));
            int page = std::stoi(query_param(query, "page"));
            Json::Value list(Json::arrayValue);
            size_t first = static_cast<size_t>((page - 1) * per_page);
            for (size_t i = first; i < release->assets.size() && i < first + static_cast<size_t>(per_page); ++i) {
                list.append(asset_json(release->assets[i]));
            }
            return json(200, list);
        }
        return status_only(404);
    }

    long next_id_ = 100;
};
