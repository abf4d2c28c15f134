#include "http.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string_view>

namespace {
    struct SlistDeleter {
        void operator()(curl_slist* list) const {
            if (list) {
                curl_slist_free_all(list);
            }
        }
    };
    using SlistHandle = std::unique_ptr<curl_slist, SlistDeleter>;

    size_t write_body(void* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* body = static_cast<std::string*>(userdata);
        size_t bytes = size * nmemb;
        body->append(static_cast<const char*>(ptr), bytes);
        return bytes;
    }

    size_t write_header(char* buffer, size_t size, size_t nitems, void* userdata) {
        const size_t total = size * nitems;
        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        std::string_view line(buffer, total);

        // A new status line starts a new header block (e.g. after "100 Continue").
        if (line.starts_with("HTTP/")) {
            headers->clear();
            return total;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return total;
        }
        (*headers)[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        return total;
    }

    bool is_transient_curl_error(CURLcode code) {
        switch (code) {
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_RECV_ERROR:
            case CURLE_SEND_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
            case CURLE_HTTP2:
            case CURLE_HTTP2_STREAM:
                return true;
            default:
                return false;
        }
    }
}

void HttpRequest::set_header(const std::string& name, const std::string& value) {
    remove_header(name);
    headers.emplace_back(name, value);
}

void HttpRequest::remove_header(const std::string& name) {
    std::string key = to_lower(name);
    std::erase_if(headers, [&](const auto& header) { return to_lower(header.first) == key; });
}

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    std::string key = to_lower(name);
    for (const auto& [header_name, value] : headers) {
        if (to_lower(header_name) == key) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HttpResponse::is_redirect() const {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

void CurlDeleter::operator()(CURL* curl) const {
    if (curl) {
        curl_easy_cleanup(curl);
    }
}

CurlTransport::CurlTransport(std::chrono::milliseconds connect_timeout, std::chrono::milliseconds read_timeout)
    : connect_timeout_(connect_timeout), read_timeout_(read_timeout) {}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    // The handle is kept between calls so its connection cache is reused.
    if (!handle_) {
        handle_.reset(curl_easy_init());
        if (!handle_) {
            throw PermanentException(request.method, request.url, 0, get_string("error.curl_init_failed"));
        }
    } else {
        curl_easy_reset(handle_.get());
    }
    CURL* curl = handle_.get();

    HttpResponse response;
    SlistHandle header_list;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw PermanentException(request.method, request.url, 0, get_string("error.curl_init_failed"));
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (!request.body.empty() || request.method == "POST") {
        // Suppress "Expect: 100-continue" round trips on uploads.
        curl_slist* appended = curl_slist_append(header_list.get(), "Expect:");
        if (appended) {
            header_list.release();
            header_list.reset(appended);
        }
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
    // A transfer that stalls below 1 byte/s for the read timeout is aborted.
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(std::max<long long>(1, read_timeout_.count() / 1000)));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        if (request.method != "POST") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        if (request.method == "POST" || !request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        }
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        // Drop the handle so a broken connection is not reused.
        handle_.reset();
        std::string detail = curl_easy_strerror(res);
        if (is_transient_curl_error(res)) {
            throw TransientException(request.method, request.url, 0, detail);
        }
        throw PermanentException(request.method, request.url, 0, detail);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    log_debug(request.method + " " + request.url + " -> " + std::to_string(response.status));
    return response;
}

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

std::string url_authority(const std::string& url) {
    size_t scheme_end = url.find("://");
    size_t start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    size_t end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }
    return to_lower(authority);
}

std::string resolve_location(const std::string& base_url, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    size_t scheme_end = base_url.find("://");
    std::string scheme = scheme_end == std::string::npos ? "https" : base_url.substr(0, scheme_end);
    if (location.starts_with("//")) {
        return scheme + ":" + location;
    }
    size_t start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    size_t path_start = base_url.find('/', start);
    std::string origin = base_url.substr(0, path_start);
    if (location.starts_with("/")) {
        return origin + location;
    }
    std::string path = path_start == std::string::npos ? "/" : base_url.substr(path_start);
    path = path.substr(0, path.find_first_of("?#"));
    return origin + path.substr(0, path.rfind('/') + 1) + location;
}

std::string url_encode(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}
