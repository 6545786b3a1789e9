#pragma once

#include <optional>
#include <string>

namespace configdesk {

// An available update, as advertised by an update endpoint
struct UpdateInfo {
    std::string version;
    std::string currentVersion;
    std::optional<std::string> body;  // release notes
    std::optional<std::string> date;
    std::string target;               // platform key the artifact was picked for
    std::string downloadUrl;
    std::optional<std::string> signature;
    std::optional<std::string> sha256;
};

} // namespace configdesk
