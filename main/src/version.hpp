#pragma once

#include <string>
#include <vector>

// Numeric-aware comparison of artifact versions: "1.10" > "1.9",
// "1.0" > "1.0-SNAPSHOT", "1.0-beta-2" > "1.0-beta-1".
// Returns <0, 0 or >0. Versions that compare equal by value but differ as
// strings ("1.0" vs "1.0.0") are ordered by string, so the order is total.
int compare_versions(const std::string& v1, const std::string& v2);

bool version_less(const std::string& v1, const std::string& v2);

// Highest version, or "" if none.
std::string latest_version(const std::vector<std::string>& versions);
// Highest non-SNAPSHOT version, or "" if none.
std::string latest_release(const std::vector<std::string>& versions);
