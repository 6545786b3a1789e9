#include "Version.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace configdesk {

namespace {

bool isNumeric(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

bool isIdentifier(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-';
    });
}

std::optional<uint64_t> parseNumber(std::string_view s) {
    // No leading zeros, except "0" itself
    if (!isNumeric(s) || (s.size() > 1 && s[0] == '0')) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

int compareIdentifiers(const std::string& a, const std::string& b) {
    const bool aNum = isNumeric(a);
    const bool bNum = isNumeric(b);
    if (aNum && bNum) {
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
    }
    // Numeric identifiers sort before alphanumeric ones
    if (aNum) return -1;
    if (bNum) return 1;
    const int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

std::optional<Version> Version::parse(std::string_view text) {
    if (!text.empty() && (text[0] == 'v' || text[0] == 'V')) {
        text.remove_prefix(1);
    }

    Version version;

    const size_t plus = text.find('+');
    if (plus != std::string_view::npos) {
        std::string_view build = text.substr(plus + 1);
        for (auto part : split(build, '.')) {
            if (!isIdentifier(part)) return std::nullopt;
        }
        version.build = std::string(build);
        text = text.substr(0, plus);
    }

    const size_t dash = text.find('-');
    if (dash != std::string_view::npos) {
        for (auto part : split(text.substr(dash + 1), '.')) {
            if (!isIdentifier(part)) return std::nullopt;
            if (isNumeric(part) && part.size() > 1 && part[0] == '0') return std::nullopt;
            version.preRelease.emplace_back(part);
        }
        text = text.substr(0, dash);
    }

    auto core = split(text, '.');
    if (core.size() != 3) {
        return std::nullopt;
    }
    auto major = parseNumber(core[0]);
    auto minor = parseNumber(core[1]);
    auto patch = parseNumber(core[2]);
    if (!major || !minor || !patch) {
        return std::nullopt;
    }
    version.major = *major;
    version.minor = *minor;
    version.patch = *patch;
    return version;
}

std::string Version::toString() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    for (size_t i = 0; i < preRelease.size(); ++i) {
        s += (i == 0 ? "-" : ".") + preRelease[i];
    }
    if (!build.empty()) {
        s += "+" + build;
    }
    return s;
}

int Version::compare(const Version& other) const {
    if (major != other.major) return major < other.major ? -1 : 1;
    if (minor != other.minor) return minor < other.minor ? -1 : 1;
    if (patch != other.patch) return patch < other.patch ? -1 : 1;

    // A pre-release has lower precedence than the release itself
    if (preRelease.empty() != other.preRelease.empty()) {
        return preRelease.empty() ? 1 : -1;
    }
    const size_t n = std::min(preRelease.size(), other.preRelease.size());
    for (size_t i = 0; i < n; ++i) {
        if (int c = compareIdentifiers(preRelease[i], other.preRelease[i]); c != 0) {
            return c;
        }
    }
    if (preRelease.size() != other.preRelease.size()) {
        return preRelease.size() < other.preRelease.size() ? -1 : 1;
    }
    return 0;
}

} // namespace configdesk
