#pragma once

#include <curl/curl.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value);
    void remove_header(const std::string& name);
    std::optional<std::string> header(const std::string& name) const;
};

struct HttpResponse {
    long status = 0;
    // Header names are stored lowercase.
    std::map<std::string, std::string> headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    bool is_redirect() const;
};

// One HTTP exchange, no redirect following.
// Implementations throw TransientException or PermanentException (status 0)
// when no response is received.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

struct CurlDeleter {
    void operator()(CURL* curl) const;
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

class CurlTransport : public HttpTransport {
public:
    CurlTransport(std::chrono::milliseconds connect_timeout, std::chrono::milliseconds read_timeout);

    HttpResponse perform(const HttpRequest& request) override;

private:
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds read_timeout_;
    std::mutex mutex_;
    CurlHandle handle_;
};

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

// "https://host:port/path" -> "host:port"
std::string url_authority(const std::string& url);
// Resolves a Location header value against the URL that produced it.
std::string resolve_location(const std::string& base_url, const std::string& location);
std::string url_encode(const std::string& value);
