#include "ServerSupervisor.hpp"
#include "utils/Logger.hpp"
#include "utils/Text.hpp"

#include <csignal>
#include <future>
#include <type_traits>
#include <variant>

namespace configdesk {

namespace {
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

void LoggerSink::info(const std::string& line) {
    Logger::getInstance().info(line);
}

void LoggerSink::error(const std::string& line) {
    Logger::getInstance().error(line);
}

ServerSupervisor::ServerSupervisor(LogSink& sink) : sink(sink) {}

ServerSupervisor::~ServerSupervisor() {
    shutdown();
}

ProcessResult ServerSupervisor::spawnAndSupervise(const CommandSpec& spec) {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(mutex);
        // starting covers the gap until the new relay thread is stored, during
        // which a quickly failing child may already have cleared active
        if (active || starting) {
            ProcessResult result;
            result.pid = child ? child->getPid() : -1;
            result.error = "Server is already running (pid " + std::to_string(result.pid) + ")";
            error("Not starting server: {}", result.error);
            return result;
        }
        active = true;
        starting = true;
        finished = std::move(relayThread);
    }
    // A previous session has fully ended once active is false
    if (finished.joinable()) {
        finished.join();
    }

    std::promise<ProcessResult> started;
    std::future<ProcessResult> startResult = started.get_future();

    std::thread worker([this, spec, started = std::move(started)]() mutable {
        auto process = std::make_shared<ChildProcess>();
        LaunchParams params;
        params.environment = spec.environment;
        ProcessResult result = process->start(spec.executable, spec.args, params);

        if (!result.success) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                active = false;
            }
            started.set_value(result);
            stoppedCv.notify_all();
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            child = process;
        }
        info("Started {} server (pid {}): {}", toString(spec.mode), result.pid, spec.commandLine());
        started.set_value(result);
        relayLoop(std::move(process));
    });

    ProcessResult result = startResult.get();
    {
        std::lock_guard<std::mutex> lock(mutex);
        relayThread = std::move(worker);
        starting = false;
    }

    if (!result.success) {
        error("Failed to start server: {}", result.error);
    }
    return result;
}

void ServerSupervisor::relayLoop(std::shared_ptr<ChildProcess> process) {
    relay(*process);
    {
        std::lock_guard<std::mutex> lock(mutex);
        child.reset();
        active = false;
    }
    stoppedCv.notify_all();
}

void ServerSupervisor::relay(ProcessEventSource& events) {
    while (auto event = events.next()) {
        handleEvent(*event);
    }
}

void ServerSupervisor::handleEvent(const ProcessEvent& event) {
    std::visit(overloaded{
        [this](const StandardOutputLine& line) {
            // Output that isn't valid UTF-8 is dropped, not reported
            if (auto text = text::decodeUtf8(line.bytes)) {
                sink.info("[server] " + *text);
            }
        },
        [this](const StandardErrorLine& line) {
            if (auto text = text::decodeUtf8(line.bytes)) {
                sink.error("[server] " + *text);
            }
        },
        [this](const LaunchError& launchError) {
            sink.error("[server error] " + launchError.message);
        },
        [this](const Terminated& terminated) {
            sink.info("[server] terminated with status: " + terminated.describe());
        },
    }, event);
}

bool ServerSupervisor::isActive() const {
    std::lock_guard<std::mutex> lock(mutex);
    return active;
}

int64_t ServerSupervisor::getPid() const {
    std::lock_guard<std::mutex> lock(mutex);
    return child ? child->getPid() : -1;
}

bool ServerSupervisor::waitUntilStopped(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return stoppedCv.wait_for(lock, timeout, [this] { return !active; });
}

void ServerSupervisor::shutdown(std::chrono::milliseconds grace) {
    std::shared_ptr<ChildProcess> running;
    {
        std::lock_guard<std::mutex> lock(mutex);
        running = child;
    }

    if (running) {
        info("Stopping server (pid {})", running->getPid());
        running->signal(SIGTERM);
        if (!waitUntilStopped(grace)) {
            warning("Server did not exit within {} ms, killing it", grace.count());
            running->signal(SIGKILL);
            waitUntilStopped(grace);
        }
    }

    if (running && !waitUntilStopped(std::chrono::milliseconds(0))) {
        // Killed, but something it spawned still holds the output pipes
        warning("Server output is still open after kill, no longer reading it");
        running->stopReading();
    }

    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex);
        worker = std::move(relayThread);
    }
    if (worker.joinable()) {
        worker.join();
    }
}

} // namespace configdesk
