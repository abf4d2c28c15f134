#pragma once

#include "resilience.hpp"

#include <chrono>
#include <filesystem>
#include <string>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path HOME_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path CACHE_DIR;
extern std::filesystem::path CONFIG_FILE;
extern std::filesystem::path L10N_DIR;

inline constexpr const char* TOKEN_ENV_VAR = "GH_RELEASE_ASSET_TOKEN";
inline constexpr const char* SETTINGS_ENV_PREFIX = "GHRELASSET_";

struct Settings {
    std::string api_endpoint = "https://api.github.com";
    std::string upload_endpoint = "https://uploads.github.com";
    std::filesystem::path cache_dir;
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds read_timeout{60000};
    int max_redirects = 5;
    bool forward_credentials_cross_host = false;
    RetryPolicy retry;
    CircuitBreakerSettings circuit_breaker;
    RateLimitSettings rate_limit;
};

// Functions
void set_home_path(const std::string& home_path);
void init_filesystem();

// Defaults, then "key = value" lines from config_file (if it exists),
// then GHRELASSET_* environment overrides.
Settings load_settings(const std::filesystem::path& config_file);
// Applies one setting; throws ConfigurationException on a bad value.
// Returns false for an unknown key.
bool apply_setting(Settings& settings, const std::string& key, const std::string& value);

// Uses the given credential, else GH_RELEASE_ASSET_TOKEN. A value naming an
// existing file is replaced by the file's trimmed content.
std::string resolve_token(const std::string& credential);
