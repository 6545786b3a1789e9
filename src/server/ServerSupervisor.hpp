#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "ServerCommand.hpp"
#include "process/ChildProcess.hpp"
#include "process/Launcher.hpp"
#include "process/ProcessEvent.hpp"

namespace configdesk {

// Line-oriented destination for relayed server output
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void info(const std::string& line) = 0;
    virtual void error(const std::string& line) = 0;
};

// Forwards to the application Logger
class LoggerSink : public LogSink {
public:
    void info(const std::string& line) override;
    void error(const std::string& line) override;
};

/**
 * Runs the UI server as a child process and relays its output.
 *
 * One child at a time: spawnAndSupervise() refuses to start another while
 * the previous one is still being relayed. The child is forked from the relay
 * thread itself, since PR_SET_PDEATHSIG fires when the forking thread exits.
 * There is no restart policy; once the child terminates the session is over.
 */
class ServerSupervisor {
public:
    static constexpr std::chrono::milliseconds DEFAULT_SHUTDOWN_GRACE{3000};

    explicit ServerSupervisor(LogSink& sink);
    ~ServerSupervisor();

    ServerSupervisor(const ServerSupervisor&) = delete;
    ServerSupervisor& operator=(const ServerSupervisor&) = delete;

    // Blocks only until the child is started (or failed to start)
    ProcessResult spawnAndSupervise(const CommandSpec& spec);

    // Drains events until the source closes, on the calling thread
    void relay(ProcessEventSource& events);
    void handleEvent(const ProcessEvent& event);

    bool isActive() const;
    int64_t getPid() const;
    bool waitUntilStopped(std::chrono::milliseconds timeout);

    // SIGTERM, then SIGKILL after the grace period. Always joins the relay
    // thread: if output is still open after the kill it stops reading it.
    void shutdown(std::chrono::milliseconds grace = DEFAULT_SHUTDOWN_GRACE);

private:
    void relayLoop(std::shared_ptr<ChildProcess> child);

    LogSink& sink;
    mutable std::mutex mutex;
    std::condition_variable stoppedCv;
    std::shared_ptr<ChildProcess> child;
    bool active = false;
    bool starting = false;
    std::thread relayThread;
};

} // namespace configdesk
