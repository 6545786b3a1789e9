#include "ServerCommand.hpp"
#include "configdesk/Constants.hpp"
#include "core/util/Env.hpp"
#include "process/Launcher.hpp"
#include "utils/Logger.hpp"

namespace fs = std::filesystem;

namespace configdesk {

const char* toString(LaunchMode mode) {
    switch (mode) {
        case LaunchMode::Production: return "production";
        case LaunchMode::Development: return "development";
        default: return "unknown";
    }
}

std::string CommandSpec::commandLine() const {
    return Launcher::buildCommandLine(executable, args);
}

std::vector<std::string> serverArguments(const std::string& cliPath) {
    return {cliPath, "ui", "--foreground", "--port", std::to_string(SERVER_PORT)};
}

std::string findDevCliPath(const fs::path& workingDir) {
    for (const char* candidate : DEV_CLI_CANDIDATES) {
        std::error_code ec;
        if (fs::exists(workingDir / candidate, ec)) {
            return candidate;
        }
    }
    return DEV_CLI_CANDIDATES.front();
}

CommandSpec resolveServerCommand(const fs::path& resourceRoot,
                                 const fs::path& sidecarDir,
                                 const fs::path& workingDir) {
    CommandSpec spec;
    const fs::path serverDir = resourceRoot / SERVER_DIR_NAME;

    std::error_code ec;
    if (fs::exists(serverDir, ec)) {
        spec.mode = LaunchMode::Production;
        spec.executable = (sidecarDir / SIDECAR_NAME).string();
        fs::path script = fs::absolute(serverDir / SERVER_SCRIPT_NAME, ec);
        if (ec) script = serverDir / SERVER_SCRIPT_NAME;
        spec.args = serverArguments(script.string());
        spec.environment["NODE_PATH"] = (serverDir / "node_modules").string();
    } else {
        spec.mode = LaunchMode::Development;
        spec.executable = DEV_RUNTIME;
        spec.args = serverArguments(findDevCliPath(workingDir));
    }

    debug("Server command ({}): {}", toString(spec.mode), spec.commandLine());
    return spec;
}

CommandSpec resolveServerCommand(const fs::path& resourceRoot) {
    return resolveServerCommand(resourceRoot, Env::executableDir(), Env::current());
}

fs::path resolveResourceRoot(const std::string& overrideDir) {
    if (!overrideDir.empty()) {
        return fs::path(Env::expand(overrideDir));
    }

    const fs::path exeDir = Env::executableDir();
    const fs::path installed = exeDir / ".." / "lib" / APP_NAME;
    std::error_code ec;
    if (fs::is_directory(installed, ec)) {
        fs::path canonical = fs::weakly_canonical(installed, ec);
        return ec ? installed : canonical;
    }
    return exeDir;
}

} // namespace configdesk
