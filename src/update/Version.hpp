#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace configdesk {

// Semantic version (semver.org 2.0). Build metadata is kept for display but
// ignored by comparisons.
struct Version {
    uint64_t major = 0;
    uint64_t minor = 0;
    uint64_t patch = 0;
    std::vector<std::string> preRelease;
    std::string build;

    // Accepts an optional leading 'v'; nullopt when the text isn't a version
    static std::optional<Version> parse(std::string_view text);

    std::string toString() const;

    // <0, 0, >0 by SemVer precedence
    int compare(const Version& other) const;

    bool operator==(const Version& other) const { return compare(other) == 0; }
    bool operator!=(const Version& other) const { return compare(other) != 0; }
    bool operator<(const Version& other) const { return compare(other) < 0; }
    bool operator>(const Version& other) const { return compare(other) > 0; }
    bool operator<=(const Version& other) const { return compare(other) <= 0; }
    bool operator>=(const Version& other) const { return compare(other) >= 0; }
};

} // namespace configdesk
