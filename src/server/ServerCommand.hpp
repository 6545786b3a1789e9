#pragma once

#include <array>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace configdesk {

enum class LaunchMode {
    Production,     // bundled sidecar runtime + packaged server/
    Development     // system node + local cli.js
};

const char* toString(LaunchMode mode);

struct CommandSpec {
    LaunchMode mode = LaunchMode::Development;
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> environment;

    std::string commandLine() const;
};

// Bundled runtime shipped next to the host executable
inline constexpr const char* SIDECAR_NAME = "node-server";
inline constexpr const char* DEV_RUNTIME = "node";
inline constexpr const char* SERVER_DIR_NAME = "server";
inline constexpr const char* SERVER_SCRIPT_NAME = "cli.js";

// Probed in order; the first entry doubles as the default
inline constexpr std::array<const char*, 3> DEV_CLI_CANDIDATES = {
    "../cli.js",
    "../../cli.js",
    "cli.js",
};

/**
 * Chooses production mode when <resourceRoot>/server exists, development mode
 * otherwise. Only checks the filesystem; a missing development script is not
 * an error here and fails later when the process is launched.
 *
 * sidecarDir is where the bundled runtime lives, workingDir is what the
 * development candidates are relative to.
 */
CommandSpec resolveServerCommand(const std::filesystem::path& resourceRoot,
                                 const std::filesystem::path& sidecarDir,
                                 const std::filesystem::path& workingDir);

// Same, with the sidecar next to this executable and the current directory
CommandSpec resolveServerCommand(const std::filesystem::path& resourceRoot);

// Returned as written (relative), not resolved against workingDir
std::string findDevCliPath(const std::filesystem::path& workingDir);

// [cliPath, "ui", "--foreground", "--port", "3333"]
std::vector<std::string> serverArguments(const std::string& cliPath);

/**
 * Where packaged resources live: explicit override (CLI or config) first,
 * then <exe dir>/../lib/configdesk when present, else the executable's own
 * directory.
 */
std::filesystem::path resolveResourceRoot(const std::string& overrideDir = "");

} // namespace configdesk
