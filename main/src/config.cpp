#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    fs::path default_home() {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return fs::path(home);
        }
        return fs::current_path();
    }

    long long parse_integer(const std::string& key, const std::string& value, long long min) {
        long long number = 0;
        auto res = std::from_chars(value.data(), value.data() + value.size(), number);
        if (res.ec != std::errc() || res.ptr != value.data() + value.size() || number < min) {
            throw ConfigurationException(string_format("error.invalid_setting", key, value));
        }
        return number;
    }

    double parse_fraction(const std::string& key, const std::string& value) {
        double number = 0;
        auto res = std::from_chars(value.data(), value.data() + value.size(), number);
        if (res.ec != std::errc() || res.ptr != value.data() + value.size() || number < 0.0 || number > 1.0) {
            throw ConfigurationException(string_format("error.invalid_setting", key, value));
        }
        return number;
    }

    bool parse_bool(const std::string& key, const std::string& value) {
        std::string lowered = to_lower(value);
        if (lowered == "true" || lowered == "yes" || lowered == "1") return true;
        if (lowered == "false" || lowered == "no" || lowered == "0") return false;
        throw ConfigurationException(string_format("error.invalid_setting", key, value));
    }

    std::string parse_url(const std::string& key, const std::string& value) {
        if (!value.starts_with("http://") && !value.starts_with("https://")) {
            throw ConfigurationException(string_format("error.invalid_setting", key, value));
        }
        std::string url = value;
        while (url.ends_with("/")) {
            url.pop_back();
        }
        return url;
    }

    using Setter = std::function<void(Settings&, const std::string&, const std::string&)>;

    const std::map<std::string, Setter>& setters() {
        static const std::map<std::string, Setter> table = {
            {"api.endpoint", [](Settings& s, const std::string& k, const std::string& v) { s.api_endpoint = parse_url(k, v); }},
            {"upload.endpoint", [](Settings& s, const std::string& k, const std::string& v) { s.upload_endpoint = parse_url(k, v); }},
            {"cache.dir", [](Settings& s, const std::string&, const std::string& v) { s.cache_dir = fs::path(v); }},
            {"connection.timeout", [](Settings& s, const std::string& k, const std::string& v) { s.connect_timeout = std::chrono::milliseconds(parse_integer(k, v, 1)); }},
            {"read.timeout", [](Settings& s, const std::string& k, const std::string& v) { s.read_timeout = std::chrono::milliseconds(parse_integer(k, v, 1)); }},
            {"redirect.max", [](Settings& s, const std::string& k, const std::string& v) { s.max_redirects = static_cast<int>(parse_integer(k, v, 0)); }},
            {"redirect.forwardcredentials", [](Settings& s, const std::string& k, const std::string& v) { s.forward_credentials_cross_host = parse_bool(k, v); }},
            {"retry.maxretries", [](Settings& s, const std::string& k, const std::string& v) { s.retry.max_retries = static_cast<int>(parse_integer(k, v, 0)); }},
            {"retry.basedelay", [](Settings& s, const std::string& k, const std::string& v) { s.retry.base_delay = std::chrono::milliseconds(parse_integer(k, v, 0)); }},
            {"retry.maxdelay", [](Settings& s, const std::string& k, const std::string& v) { s.retry.max_delay = std::chrono::milliseconds(parse_integer(k, v, 0)); }},
            {"retry.jitter", [](Settings& s, const std::string& k, const std::string& v) { s.retry.jitter = parse_fraction(k, v); }},
            {"circuitbreaker.failurethreshold", [](Settings& s, const std::string& k, const std::string& v) { s.circuit_breaker.failure_threshold = static_cast<int>(parse_integer(k, v, 1)); }},
            {"circuitbreaker.successthreshold", [](Settings& s, const std::string& k, const std::string& v) { s.circuit_breaker.success_threshold = static_cast<int>(parse_integer(k, v, 1)); }},
            {"circuitbreaker.timeout", [](Settings& s, const std::string& k, const std::string& v) { s.circuit_breaker.cooldown = std::chrono::milliseconds(parse_integer(k, v, 0)); }},
            {"ratelimit.maxwait", [](Settings& s, const std::string& k, const std::string& v) { s.rate_limit.max_wait = std::chrono::milliseconds(parse_integer(k, v, 0)); }},
            {"ratelimit.defaultwait", [](Settings& s, const std::string& k, const std::string& v) { s.rate_limit.default_wait = std::chrono::milliseconds(parse_integer(k, v, 0)); }},
            {"ratelimit.maxwaits", [](Settings& s, const std::string& k, const std::string& v) { s.rate_limit.max_waits = static_cast<int>(parse_integer(k, v, 0)); }},
            {"ratelimit.throttlethreshold", [](Settings& s, const std::string& k, const std::string& v) { s.rate_limit.throttle_threshold = static_cast<int>(parse_integer(k, v, 0)); }},
        };
        return table;
    }
}

fs::path HOME_DIR = default_home();
fs::path CONFIG_DIR = HOME_DIR / ".ghrelasset";
fs::path CACHE_DIR = CONFIG_DIR / "repos";
fs::path CONFIG_FILE = CONFIG_DIR / "ghrel.conf";
fs::path L10N_DIR = GHREL_L10N_DIR;

void set_home_path(const std::string& home_path) {
    HOME_DIR = fs::path(home_path).lexically_normal();
    CONFIG_DIR = HOME_DIR / ".ghrelasset";
    CACHE_DIR = CONFIG_DIR / "repos";
    CONFIG_FILE = CONFIG_DIR / "ghrel.conf";
}

void init_filesystem() {
    ensure_dir_exists(CONFIG_DIR);
    ensure_dir_exists(CACHE_DIR);
}

bool apply_setting(Settings& settings, const std::string& key, const std::string& value) {
    auto it = setters().find(to_lower(key));
    if (it == setters().end()) {
        return false;
    }
    it->second(settings, it->first, trim(value));
    return true;
}

Settings load_settings(const fs::path& config_file) {
    Settings settings;
    settings.cache_dir = CACHE_DIR;

    std::ifstream file(config_file);
    if (file.is_open()) {
        std::string line;
        int line_number = 0;
        while (std::getline(file, line)) {
            ++line_number;
            std::string content = trim(line);
            if (content.empty() || content.front() == '#') {
                continue;
            }
            size_t pos = content.find('=');
            if (pos == std::string::npos) {
                throw ConfigurationException(string_format("error.config_syntax", config_file.string(), line_number));
            }
            std::string key = trim(content.substr(0, pos));
            if (!apply_setting(settings, key, content.substr(pos + 1))) {
                log_warning(string_format("warning.unknown_setting", key, config_file.string()));
            }
        }
    }

    std::string prefix = SETTINGS_ENV_PREFIX;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        if (!entry.starts_with(prefix)) {
            continue;
        }
        size_t pos = entry.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        std::string key = to_lower(entry.substr(prefix.size(), pos - prefix.size()));
        std::replace(key.begin(), key.end(), '_', '.');
        if (!apply_setting(settings, key, entry.substr(pos + 1))) {
            log_debug(string_format("warning.unknown_setting", key, "environment"));
        }
    }

    return settings;
}

std::string resolve_token(const std::string& credential) {
    std::string value = credential;
    if (value.empty()) {
        const char* env = std::getenv(TOKEN_ENV_VAR);
        if (env) {
            value = env;
        }
    }
    value = trim(value);
    if (value.empty()) {
        throw ConfigurationException(string_format("error.missing_token", TOKEN_ENV_VAR));
    }

    std::error_code ec;
    if (fs::is_regular_file(value, ec)) {
        value = trim(read_file_bytes(value));
        if (value.empty()) {
            throw ConfigurationException(string_format("error.empty_token_file", credential.empty() ? std::string(TOKEN_ENV_VAR) : credential));
        }
    }
    return value;
}
