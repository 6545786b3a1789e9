#include "Env.hpp"
#include <filesystem>
#include <cstdlib>
#include <climits>
#include <sys/utsname.h>

extern char** environ;

namespace fs = std::filesystem;
namespace configdesk {

std::string Env::expand(const std::string& path) {
    return expandTilde(path);
}

std::string Env::get(const std::string& name, const std::string& defaultValue) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : defaultValue;
}

std::map<std::string, std::string> Env::getAll() {
    std::map<std::string, std::string> env;
    for (char** current = environ; current && *current; ++current) {
        std::string line(*current);
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            env[line.substr(0, pos)] = line.substr(pos + 1);
        }
    }
    return env;
}

// System paths
std::string Env::home() {
    const char* home = getenv("HOME");
    if (home) return std::string(home);

    struct passwd* pw = getpwuid(getuid());
    return pw ? std::string(pw->pw_dir) : "/tmp";
}

std::string Env::current() {
    std::error_code ec;
    auto path = fs::current_path(ec);
    return ec ? "." : path.string();
}

std::string Env::executable() {
    char path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len != -1) {
        path[len] = '\0';
        return std::string(path);
    }
    return "";
}

std::string Env::executableDir() {
    std::string exe = executable();
    if (exe.empty()) return current();
    return fs::path(exe).parent_path().string();
}

std::string Env::config() {
    std::string xdg = get("XDG_CONFIG_HOME");
    return xdg.empty() ? join({home(), ".config"}) : xdg;
}

std::string Env::data() {
    std::string xdg = get("XDG_DATA_HOME");
    return xdg.empty() ? join({home(), ".local", "share"}) : xdg;
}

// PATH operations
std::vector<std::string> Env::getPath() {
    return splitPath(get("PATH"));
}

std::string Env::which(const std::string& command) {
    if (command.find('/') != std::string::npos) {
        return isExecutable(command) ? command : "";
    }
    for (const auto& dir : getPath()) {
        std::string fullPath = join({dir, command});
        if (isFile(fullPath) && isExecutable(fullPath)) {
            return fullPath;
        }
    }
    return "";
}

std::string Env::architecture() {
    struct utsname info{};
    std::string machine = uname(&info) == 0 ? info.machine : "";

    if (machine == "x86_64" || machine == "amd64") return "x86_64";
    if (machine == "aarch64" || machine == "arm64") return "aarch64";
    if (machine == "i386" || machine == "i486" || machine == "i586" || machine == "i686") return "i686";
    if (machine.rfind("armv7", 0) == 0) return "armv7";
    if (!machine.empty()) return machine;

#if defined(__x86_64__)
    return "x86_64";
#elif defined(__aarch64__)
    return "aarch64";
#elif defined(__i386__)
    return "i686";
#elif defined(__arm__)
    return "armv7";
#else
    return "unknown";
#endif
}

// Utility functions
std::string Env::join(const std::vector<std::string>& paths) {
    if (paths.empty()) return "";
    if (paths.size() == 1) return paths[0];

    std::string result = paths[0];
    for (size_t i = 1; i < paths.size(); ++i) {
        if (!result.empty() && result.back() != '/') {
            result += '/';
        }
        result += paths[i];
    }
    return result;
}

// File system helpers
bool Env::isFile(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(expand(path), ec);
}

bool Env::isExecutable(const std::string& path) {
    return access(expand(path).c_str(), X_OK) == 0;
}

// Private helper methods
std::string Env::expandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;

    if (path.length() == 1 || path[1] == '/') {
        return home() + path.substr(1);
    }

    // ~username
    size_t pos = path.find('/');
    std::string username = path.substr(1, pos == std::string::npos ? std::string::npos : pos - 1);

    struct passwd* pw = getpwnam(username.c_str());
    if (pw) {
        return std::string(pw->pw_dir) + (pos == std::string::npos ? "" : path.substr(pos));
    }
    return path;
}

std::vector<std::string> Env::splitPath(const std::string& pathStr) {
    std::vector<std::string> paths;
    std::string current;

    for (char c : pathStr) {
        if (c == ':') {
            if (!current.empty()) {
                paths.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        paths.push_back(current);
    }

    return paths;
}

} // namespace configdesk
