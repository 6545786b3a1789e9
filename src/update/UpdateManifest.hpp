#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Version.hpp"

namespace configdesk {

struct PlatformArtifact {
    std::string url;
    std::optional<std::string> signature;
    std::optional<std::string> sha256;
};

/**
 * Static JSON update manifest:
 *
 *   {
 *     "version": "1.2.0",
 *     "notes": "...",
 *     "pub_date": "2024-01-01T00:00:00Z",
 *     "platforms": {
 *       "linux-x86_64-appimage": { "url": "...", "signature": "...", "sha256": "..." }
 *     }
 *   }
 */
struct UpdateManifest {
    Version version;
    std::optional<std::string> notes;
    std::optional<std::string> pubDate;
    std::map<std::string, PlatformArtifact> platforms;

    // Throws UpdateCheckError on malformed JSON or missing required fields
    static UpdateManifest parse(const std::string& json);

    // First of `targets` present in the manifest
    std::optional<std::pair<std::string, PlatformArtifact>>
    findPlatform(const std::vector<std::string>& targets) const;

    // Platform keys this build looks for, most specific first
    static std::vector<std::string> targetsFor(const std::string& arch);
};

} // namespace configdesk
