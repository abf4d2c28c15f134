#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <climits>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        if (count != -1) {
            return fs::path(std::string(result, static_cast<size_t>(count))).parent_path();
        }
        return fs::current_path();
    }
}

void load_strings(const std::string& lang, const fs::path& base_dir) {
    auto file_path = base_dir / (lang + ".txt");
    std::ifstream file(file_path);
    if (!file.is_open()) {
        if (lang != "en") {
            load_strings("en", base_dir);
        }
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.front() == '#') {
            continue;
        }
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            translations[line.substr(0, pos)] = line.substr(pos + 1);
        }
    }
}

fs::path find_l10n_dir(const fs::path& executable_dir) {
    for (const fs::path& candidate : {executable_dir / ".." / "share" / "ghrel" / "l10n", executable_dir / ".." / "l10n"}) {
        if (fs::is_directory(candidate)) {
            return candidate;
        }
    }
    return L10N_DIR;
}

void init_localization() {
    const char* lang_env = std::getenv("LANG");
    std::string lang = "en";
    if (lang_env) {
        std::string value(lang_env);
        size_t cut = value.find_first_of("_.@");
        value = value.substr(0, cut);
        if (!value.empty() && value != "C" && value != "POSIX") {
            lang = value;
        }
    }

    load_strings(lang, find_l10n_dir(get_executable_dir()));
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
