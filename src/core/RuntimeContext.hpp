#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace configdesk {

/**
 * Background execution contexts for the host's long-running tasks
 * (server bootstrap, update flow). Each task gets its own named thread.
 *
 * Tasks are fire-and-forget: nothing waits on them, and any still running
 * when the context is destroyed are detached. A task that throws has its
 * exception logged; it never reaches the GUI thread.
 */
class RuntimeContext {
public:
    RuntimeContext() = default;
    ~RuntimeContext();

    RuntimeContext(const RuntimeContext&) = delete;
    RuntimeContext& operator=(const RuntimeContext&) = delete;

    void spawn(const std::string& name, std::function<void()> task);

    size_t taskCount() const;

private:
    mutable std::mutex mutex;
    std::vector<std::thread> threads;
};

} // namespace configdesk
