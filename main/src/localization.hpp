#pragma once

#include <filesystem>
#include <format>
#include <string>
#include <string_view>

void init_localization();
// String tables next to an installed binary (<prefix>/share/ghrel/l10n), then
// beside a build tree binary (../l10n), else the configured L10N_DIR.
std::filesystem::path find_l10n_dir(const std::filesystem::path& executable_dir);
void load_strings(const std::string& lang, const std::filesystem::path& base_dir);
const std::string& get_string(const std::string& key);

// Variadic template for string formatting using modern C++20 std::format
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return "ghrel formatting error [key: " + key + "]: " + e.what();
    }
}
