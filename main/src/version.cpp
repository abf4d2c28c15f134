#include "version.hpp"
#include "coordinates.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {
    bool is_number(const std::string& part) {
        return !part.empty() && std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); });
    }

    // Compares digit strings without overflow.
    int compare_numeric(const std::string& a, const std::string& b) {
        size_t a_start = std::min(a.find_first_not_of('0'), a.size());
        size_t b_start = std::min(b.find_first_not_of('0'), b.size());
        size_t a_len = a.size() - a_start;
        size_t b_len = b.size() - b_start;
        if (a_len != b_len) {
            return a_len < b_len ? -1 : 1;
        }
        int cmp = a.compare(a_start, a_len, b, b_start, b_len);
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }

    std::vector<std::string> split(const std::string& text, const std::regex& separators) {
        if (text.empty()) {
            return {};
        }
        return {std::sregex_token_iterator(text.begin(), text.end(), separators, -1), std::sregex_token_iterator()};
    }

    int compare_value(const std::string& v1_str, const std::string& v2_str) {
        // Split into main version and qualifier part
        std::string v1_main = v1_str, v1_pre, v2_main = v2_str, v2_pre;
        size_t v1_hyphen = v1_str.find('-');
        if (v1_hyphen != std::string::npos) {
            v1_main = v1_str.substr(0, v1_hyphen);
            v1_pre = v1_str.substr(v1_hyphen + 1);
        }
        size_t v2_hyphen = v2_str.find('-');
        if (v2_hyphen != std::string::npos) {
            v2_main = v2_str.substr(0, v2_hyphen);
            v2_pre = v2_str.substr(v2_hyphen + 1);
        }

        // Compare main versions
        static const std::regex re_dot("[.]");
        std::vector<std::string> p1_main = split(v1_main, re_dot);
        std::vector<std::string> p2_main = split(v2_main, re_dot);

        size_t main_len = std::max(p1_main.size(), p2_main.size());
        for (size_t i = 0; i < main_len; ++i) {
            std::string part1 = i < p1_main.size() ? p1_main[i] : "0";
            std::string part2 = i < p2_main.size() ? p2_main[i] : "0";
            bool is_num1 = is_number(part1);
            bool is_num2 = is_number(part2);
            if (is_num1 && is_num2) {
                if (int cmp = compare_numeric(part1, part2); cmp != 0) return cmp;
            } else if (is_num1 != is_num2) {
                return is_num1 ? 1 : -1;
            } else if (part1 != part2) {
                return part1 < part2 ? -1 : 1;
            }
        }

        // Main versions are equal, compare qualifiers
        if (v1_pre.empty() && !v2_pre.empty()) return 1;   // 1.0 > 1.0-SNAPSHOT
        if (!v1_pre.empty() && v2_pre.empty()) return -1;
        if (v1_pre.empty() && v2_pre.empty()) return 0;

        static const std::regex re_pre("[.-]");
        std::vector<std::string> p1_pre = split(v1_pre, re_pre);
        std::vector<std::string> p2_pre = split(v2_pre, re_pre);

        size_t pre_len = std::max(p1_pre.size(), p2_pre.size());
        for (size_t i = 0; i < pre_len; ++i) {
            if (i >= p1_pre.size()) return -1;  // 1.0-alpha < 1.0-alpha.1
            if (i >= p2_pre.size()) return 1;

            const std::string& part1 = p1_pre[i];
            const std::string& part2 = p2_pre[i];
            bool is_num1 = is_number(part1);
            bool is_num2 = is_number(part2);

            if (is_num1 && is_num2) {
                if (int cmp = compare_numeric(part1, part2); cmp != 0) return cmp;
            } else {
                if (is_num1 && !is_num2) return -1;
                if (!is_num1 && is_num2) return 1;
                if (part1 < part2) return -1;
                if (part1 > part2) return 1;
            }
        }
        return 0;
    }
}

int compare_versions(const std::string& v1, const std::string& v2) {
    int cmp = compare_value(v1, v2);
    if (cmp != 0) {
        return cmp;
    }
    return v1 < v2 ? -1 : (v1 > v2 ? 1 : 0);
}

bool version_less(const std::string& v1, const std::string& v2) {
    return compare_versions(v1, v2) < 0;
}

std::string latest_version(const std::vector<std::string>& versions) {
    auto it = std::max_element(versions.begin(), versions.end(), version_less);
    return it == versions.end() ? "" : *it;
}

std::string latest_release(const std::vector<std::string>& versions) {
    std::string best;
    for (const auto& version : versions) {
        if (is_snapshot_version(version)) {
            continue;
        }
        if (best.empty() || version_less(best, version)) {
            best = version;
        }
    }
    return best;
}
