#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "FileDescriptor.hpp"
#include "Launcher.hpp"
#include "ProcessEvent.hpp"

namespace configdesk {

/**
 * A child process with piped stdout/stderr, read as a ProcessEventSource.
 *
 * start() and next() belong to one thread (the one draining the output).
 * signal() may be called from any thread; it never reaches a recycled pid
 * because the child is only reaped under the same lock.
 */
class ChildProcess : public ProcessEventSource {
public:
    ChildProcess() = default;
    ~ChildProcess() override;

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // Fails (success=false) when fork or exec fails; exec errors are
    // reported through a close-on-exec status pipe.
    ProcessResult start(const std::string& executable,
                        const std::vector<std::string>& args,
                        const LaunchParams& params = {});

    std::optional<ProcessEvent> next() override;

    // Delivered to the child's whole process group
    bool signal(int sig);

    // Makes next() give up on the output pipes and go straight to reaping.
    // For children whose pipes stay open through a detached descendant.
    void stopReading();
    pid_t getPid() const;
    bool hasExited() const;

private:
    struct Stream {
        FileDescriptor fd;
        std::string buffer;
        bool isStderr = false;
    };

    void pump();
    void readFrom(Stream& stream);
    void emitLine(const Stream& stream, std::string_view line);
    void closeStream(Stream& stream);
    ProcessEvent reap();
    // Caller holds reapMutex
    bool signalGroup(int sig);

    pid_t pid = -1;
    Stream out;
    FileDescriptor wakeRead;
    FileDescriptor wakeWrite;
    Stream err{FileDescriptor(), std::string(), true};
    std::deque<ProcessEvent> pending;
    bool finished = false;

    mutable std::mutex reapMutex;
    bool reaped = false;
};

} // namespace configdesk
