#include "SignalWatcher.hpp"
#include "utils/Logger.hpp"
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <pthread.h>

namespace configdesk::util {

namespace {
const std::initializer_list<int> kWatchedSignals = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};
}

const std::initializer_list<int>& watchedSignals() {
    return kWatchedSignals;
}

void SignalWatcher::logSignal(int sig) {
    const char* signame = "Unknown";
    switch (sig) {
        case SIGINT:  signame = "SIGINT"; break;
        case SIGTERM: signame = "SIGTERM"; break;
        case SIGHUP:  signame = "SIGHUP"; break;
        case SIGQUIT: signame = "SIGQUIT"; break;
    }
    info("[SignalWatcher] Received signal: {} ({})", signame, sig);
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (watcherThread.joinable()) {
        throw std::runtime_error("SignalWatcher already running");
    }

    watcherThread = std::thread([this]() {
        sigset_t set;
        sigemptyset(&set);
        for (int sig : kWatchedSignals) {
            sigaddset(&set, sig);
        }

        int sig = 0;
        while (!shouldExit.load(std::memory_order_relaxed)) {
            // sigwait returns the error instead of setting errno
            const int result = sigwait(&set, &sig);
            if (result != 0) {
                if (result == EINTR) continue;
                std::error_code ec(result, std::system_category());
                error("[SignalWatcher] sigwait failed: {}", ec.message());
                break;
            }
            if (stopping.load(std::memory_order_relaxed)) {
                break;
            }
            logSignal(sig);
            if (sig == SIGINT || sig == SIGTERM) {
                shouldExit.store(true, std::memory_order_relaxed);
                if (cleanupCallback) {
                    cleanupCallback(sig);
                }
                break;
            }
        }
    });
}

void SignalWatcher::stop() {
    if (!watcherThread.joinable()) {
        return;
    }
    if (!shouldExit.load(std::memory_order_relaxed)) {
        // Wake sigwait without treating it as a termination request
        stopping.store(true, std::memory_order_relaxed);
        pthread_kill(watcherThread.native_handle(), SIGTERM);
    }
    watcherThread.join();
}

void blockSignals(const std::initializer_list<int>& signals) {
    sigset_t set;
    sigemptyset(&set);
    for (int sig : signals) {
        sigaddset(&set, sig);
    }
    // pthread_sigmask returns the error instead of setting errno
    const int result = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (result != 0) {
        throw std::system_error(result, std::system_category(), "Failed to block signals");
    }
}

} // namespace configdesk::util
