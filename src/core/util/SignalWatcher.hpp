#pragma once

#include <csignal>
#include <thread>
#include <atomic>
#include <string>
#include <functional>
#include <initializer_list>

namespace configdesk::util {

// Waits for termination signals on its own thread. The signals must be
// blocked in every thread (blockSignals() before any thread is created),
// otherwise the kernel may deliver them elsewhere.
class SignalWatcher {
private:
    std::atomic<bool> shouldExit{false};
    std::atomic<bool> stopping{false};
    std::thread watcherThread;
    std::function<void(int)> cleanupCallback;

    static void logSignal(int sig);

public:
    SignalWatcher() = default;
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;
    SignalWatcher(SignalWatcher&&) = delete;
    SignalWatcher& operator=(SignalWatcher&&) = delete;

    void start();
    void stop();

    // Runs on the watcher thread after SIGINT/SIGTERM
    void setCleanupCallback(std::function<void(int)> callback) {
        cleanupCallback = std::move(callback);
    }
};

// The signals the watcher handles
const std::initializer_list<int>& watchedSignals();

// Block specific signals in the calling thread
void blockSignals(const std::initializer_list<int>& signalsToBlock);

} // namespace configdesk::util
