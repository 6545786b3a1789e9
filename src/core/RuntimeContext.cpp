#include "RuntimeContext.hpp"
#include "utils/Logger.hpp"

#include <exception>
#include <pthread.h>

namespace configdesk {

RuntimeContext::~RuntimeContext() {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.detach();
        }
    }
    threads.clear();
}

void RuntimeContext::spawn(const std::string& name, std::function<void()> task) {
    std::thread worker([name, task = std::move(task)]() {
        // Kernel thread names are limited to 15 characters
        pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
        debug("RuntimeContext: task '{}' started", name);
        try {
            task();
        } catch (const std::exception& e) {
            error("RuntimeContext: task '{}' failed: {}", name, e.what());
            return;
        }
        debug("RuntimeContext: task '{}' finished", name);
    });

    std::lock_guard<std::mutex> lock(mutex);
    threads.push_back(std::move(worker));
}

size_t RuntimeContext::taskCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return threads.size();
}

} // namespace configdesk
