#pragma once

#include <optional>
#include <string>
#include <variant>

namespace configdesk {

// Raw bytes of one line, line ending removed
struct StandardOutputLine {
    std::string bytes;
};

struct StandardErrorLine {
    std::string bytes;
};

// The process layer failed while the child was running (read or wait errors)
struct LaunchError {
    std::string message;
};

struct Terminated {
    std::optional<int> code;
    std::optional<int> signal;

    std::string describe() const;
};

using ProcessEvent = std::variant<StandardOutputLine, StandardErrorLine, LaunchError, Terminated>;

/**
 * Ordered lifecycle events of one child process.
 * next() blocks until an event is available and returns nullopt once the
 * stream is closed (the child exited and all of its output was drained).
 */
class ProcessEventSource {
public:
    virtual ~ProcessEventSource() = default;
    virtual std::optional<ProcessEvent> next() = 0;
};

} // namespace configdesk
