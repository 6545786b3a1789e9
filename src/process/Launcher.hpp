#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>


namespace configdesk {

struct LaunchParams {
    std::string workingDir;
    // Added to (or replacing entries of) the inherited environment
    std::map<std::string, std::string> environment;
    // PR_SET_PDEATHSIG: the child gets SIGTERM when its parent thread exits
    bool dieWithParent = true;
};

struct ProcessResult {
    int64_t pid = -1;
    bool success = false;
    std::string error;
};

class Launcher {
public:
    // "NAME=value" entries: the current environment with overrides applied
    static std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides);

    // POSIX shell quoting, for log output
    static std::string escapeArgument(const std::string& arg);
    static std::string buildCommandLine(const std::string& executable,
                                        const std::vector<std::string>& args);
};

} // namespace configdesk
