#include "Launcher.hpp"
#include "core/util/Env.hpp"

namespace configdesk {

std::vector<std::string> Launcher::buildEnvironment(const std::map<std::string, std::string>& overrides) {
    auto env = Env::getAll();
    for (const auto& [name, value] : overrides) {
        env[name] = value;
    }

    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [name, value] : env) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

std::string Launcher::escapeArgument(const std::string& arg) {
    if (arg.empty()) return "''";
    if (arg.find_first_of(" \t\n'\"\\$`") == std::string::npos) {
        return arg;
    }

    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped += c;
        }
    }
    escaped += "'";
    return escaped;
}

std::string Launcher::buildCommandLine(const std::string& executable,
                                       const std::vector<std::string>& args) {
    std::string cmdLine = escapeArgument(executable);
    for (const auto& arg : args) {
        cmdLine += " " + escapeArgument(arg);
    }
    return cmdLine;
}

} // namespace configdesk
