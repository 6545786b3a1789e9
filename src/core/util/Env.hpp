#pragma once

#include <string>
#include <vector>
#include <map>

#include <unistd.h>
#include <pwd.h>
#include <sys/types.h>

namespace configdesk {
class Env {
public:
    // Path expansion and resolution
    static std::string expand(const std::string& path);

    // Environment variable operations
    static std::string get(const std::string& name, const std::string& defaultValue = "");
    static std::map<std::string, std::string> getAll();

    // System paths
    static std::string home();
    static std::string current();
    static std::string executable();
    static std::string executableDir();
    static std::string config();
    static std::string data();

    // PATH operations
    static std::vector<std::string> getPath();
    static std::string which(const std::string& command);

    // Platform info, using the names release manifests use (x86_64, aarch64, i686, armv7)
    static std::string architecture();

    // Utility functions
    static std::string join(const std::vector<std::string>& paths);

    // File system helpers
    static bool isFile(const std::string& path);
    static bool isExecutable(const std::string& path);

private:
    Env() = delete;

    static std::string expandTilde(const std::string& path);
    static std::vector<std::string> splitPath(const std::string& pathStr);
};
} // namespace configdesk
