#include "session.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

RepositorySession::RepositorySession(const Settings& settings, HttpTransport& transport, ResilientExecutor& executor,
                                     Clock& clock)
    : settings_(settings), transport_(transport), executor_(executor), clock_(clock) {}

RepositorySession::~RepositorySession() {
    if (is_open() && !staging_.empty()) {
        log_warning(string_format("warning.session_unpublished", staging_.size(), endpoint_->canonical()));
    }
}

void RepositorySession::open(std::string_view endpoint_uri, const std::string& credential) {
    if (is_open()) {
        throw GhrelException(string_format("error.session_already_open", endpoint_->canonical()));
    }
    auto endpoint = std::make_unique<RepositoryEndpoint>(parse_endpoint(endpoint_uri));
    std::string token = resolve_token(credential);

    auto client = std::make_unique<ReleaseClient>(transport_, executor_, settings_, std::move(token));
    auto cache = std::make_unique<ArchiveCache>(settings_.cache_dir, *endpoint, *client);
    cache->open();

    endpoint_ = std::move(endpoint);
    client_ = std::move(client);
    cache_ = std::move(cache);
    staging_.clear();
    pipeline_ = std::make_unique<ArtifactPipeline>(*cache_, staging_, clock_.now());
    log_debug(string_format("debug.session_opened", endpoint_->canonical(), cache_->archive_path().string()));
}

void RepositorySession::require_open() const {
    if (!is_open()) {
        throw GhrelException(get_string("error.session_not_open"));
    }
}

std::optional<std::string> RepositorySession::read_resource(std::string_view path) const {
    require_open();
    return cache_->read(path);
}

void RepositorySession::write_resource(std::string_view path, std::string content) {
    require_open();
    std::string normalized = normalize_resource_path(path);
    cache_->write(normalized, content);
    staging_.add(normalized);
    pipeline_->process(normalized, content);
}

bool RepositorySession::resource_exists(std::string_view path) const {
    require_open();
    return cache_->exists(path);
}

std::vector<std::string> RepositorySession::list_resources(std::string_view prefix) const {
    require_open();
    return cache_->list(prefix);
}

void RepositorySession::close() {
    if (!is_open()) {
        return;
    }
    if (!staging_.empty()) {
        cache_->flush();
        std::string content = read_file_bytes(cache_->archive_path());
        log_info(string_format("info.publishing", staging_.size(), endpoint_->canonical()));
        client_->publish(*endpoint_, content);
        staging_.clear();
    }
    cache_->close();
    pipeline_.reset();
    cache_.reset();
    client_.reset();
    endpoint_.reset();
}

bool RepositorySession::is_remote_newer(std::chrono::system_clock::time_point since) {
    require_open();
    auto asset = client_->find_endpoint_asset(*endpoint_);
    if (!asset) {
        return false;
    }
    std::chrono::system_clock::time_point updated;
    if (!parse_iso8601(asset->updated_at, updated)) {
        log_warning(string_format("warning.unparseable_timestamp", asset->updated_at));
        return true;
    }
    return updated > since;
}

bool RepositorySession::refresh_if_newer() {
    require_open();
    if (!staging_.empty()) {
        throw CacheException(string_format("error.reload_with_pending", endpoint_->canonical()));
    }
    std::chrono::system_clock::time_point local_time{};
    std::error_code ec;
    auto write_time = fs::last_write_time(cache_->archive_path(), ec);
    if (!ec) {
        local_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(write_time));
    }
    if (!is_remote_newer(local_time)) {
        return false;
    }
    cache_->reload_from_remote();
    return true;
}

const RepositoryEndpoint& RepositorySession::endpoint() const {
    require_open();
    return *endpoint_;
}

const fs::path& RepositorySession::archive_path() const {
    require_open();
    return cache_->archive_path();
}
