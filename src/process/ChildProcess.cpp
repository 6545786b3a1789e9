#include "ChildProcess.hpp"
#include "utils/Logger.hpp"
#include "utils/Text.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace configdesk {

namespace {
struct AutoPipe {
    FileDescriptor output;
    FileDescriptor input;

    static std::optional<AutoPipe> create() {
        auto fd = std::array<int, 2>();
        if (pipe2(fd.data(), O_CLOEXEC) == -1) {
            return std::nullopt;
        }
        return AutoPipe{FileDescriptor(fd[0]), FileDescriptor(fd[1])};
    }
};

// Child side: report errno to the parent and exit without running atexit handlers
[[noreturn]] void failChild(int statusFd, int errorCode) {
    ssize_t ignored = write(statusFd, &errorCode, sizeof(errorCode));
    (void)ignored;
    _exit(127);
}

std::string errnoMessage(const std::string& what, int errorCode) {
    return what + ": " + std::strerror(errorCode);
}
} // namespace

std::string Terminated::describe() const {
    if (code) {
        return "exit code " + std::to_string(*code);
    }
    if (signal) {
        const char* name = strsignal(*signal);
        return "signal " + std::to_string(*signal) + (name ? std::string(" (") + name + ")" : std::string());
    }
    return "unknown";
}

ChildProcess::~ChildProcess() {
    if (pid <= 0) return;
    std::lock_guard<std::mutex> lock(reapMutex);
    if (!reaped) {
        signalGroup(SIGKILL);
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        reaped = true;
    }
}

ProcessResult ChildProcess::start(const std::string& executable,
                                  const std::vector<std::string>& args,
                                  const LaunchParams& params) {
    ProcessResult result;
    if (pid > 0) {
        result.error = "Process already started";
        return result;
    }
    if (executable.empty()) {
        result.error = "Empty executable path";
        return result;
    }

    auto stdoutPipe = AutoPipe::create();
    auto stderrPipe = AutoPipe::create();
    auto statusPipe = AutoPipe::create();
    auto wakePipe = AutoPipe::create();
    if (!stdoutPipe || !stderrPipe || !statusPipe || !wakePipe) {
        result.error = errnoMessage("Failed to create pipes", errno);
        return result;
    }

    // Everything the child needs is built before fork(): only
    // async-signal-safe calls are allowed between fork() and exec().
    std::vector<std::string> envStorage = Launcher::buildEnvironment(params.environment);
    std::vector<char*> envp;
    envp.reserve(envStorage.size() + 1);
    for (auto& entry : envStorage) envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<std::string> argvStorage;
    argvStorage.reserve(args.size() + 1);
    argvStorage.push_back(executable);
    argvStorage.insert(argvStorage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argvStorage.size() + 1);
    for (auto& arg : argvStorage) argv.push_back(arg.data());
    argv.push_back(nullptr);

    const char* workdir = params.workingDir.empty() ? nullptr : params.workingDir.c_str();
    const pid_t parentPid = getpid();

    const pid_t child = fork();
    if (child < 0) {
        result.error = errnoMessage("fork() failed", errno);
        return result;
    }

    if (child == 0) {
        const int statusFd = statusPipe->input.get();

        // The host blocks signals for its watcher thread; don't pass that on
        sigset_t unblocked;
        sigemptyset(&unblocked);
        pthread_sigmask(SIG_SETMASK, &unblocked, nullptr);

        if (params.dieWithParent) {
            if (prctl(PR_SET_PDEATHSIG, SIGTERM) == -1) {
                failChild(statusFd, errno);
            }
            if (getppid() != parentPid) {
                _exit(0);
            }
        }

        // Own process group, so signals also reach anything the child spawns
        // (those would otherwise keep our pipes open)
        if (setpgid(0, 0) == -1) {
            failChild(statusFd, errno);
        }

        if (dup2(stdoutPipe->input.get(), STDOUT_FILENO) == -1 ||
            dup2(stderrPipe->input.get(), STDERR_FILENO) == -1) {
            failChild(statusFd, errno);
        }
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        if (workdir != nullptr && chdir(workdir) == -1) {
            failChild(statusFd, errno);
        }

        execvpe(argv[0], argv.data(), envp.data());
        failChild(statusFd, errno);
    }

    // Parent: drop the write ends so EOF arrives when the child is gone
    stdoutPipe->input.reset();
    stderrPipe->input.reset();
    statusPipe->input.reset();

    int childErrno = 0;
    ssize_t n = 0;
    do {
        n = read(statusPipe->output.get(), &childErrno, sizeof(childErrno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (waitpid(child, &status, 0) == -1 && errno == EINTR) {}
        result.error = errnoMessage("Failed to launch '" + executable + "'", childErrno);
        return result;
    }

    pid = child;
    out.fd = std::move(stdoutPipe->output);
    err.fd = std::move(stderrPipe->output);
    wakeRead = std::move(wakePipe->output);
    wakeWrite = std::move(wakePipe->input);

    result.pid = child;
    result.success = true;
    debug("ChildProcess: started pid {}: {}", child, Launcher::buildCommandLine(executable, args));
    return result;
}

std::optional<ProcessEvent> ChildProcess::next() {
    while (true) {
        if (!pending.empty()) {
            ProcessEvent event = std::move(pending.front());
            pending.pop_front();
            return event;
        }
        if (finished || pid <= 0) {
            return std::nullopt;
        }
        if (out.fd.valid() || err.fd.valid()) {
            pump();
            continue;
        }
        finished = true;
        return reap();
    }
}

void ChildProcess::pump() {
    // Last slot is the wake pipe
    std::array<pollfd, 3> fds{};
    std::array<Stream*, 2> streams{};
    nfds_t count = 0;
    for (Stream* stream : {&out, &err}) {
        if (stream->fd.valid()) {
            fds[count] = pollfd{stream->fd.get(), POLLIN, 0};
            streams[count] = stream;
            ++count;
        }
    }
    fds[count] = pollfd{wakeRead.get(), POLLIN, 0};

    if (poll(fds.data(), count + 1, -1) == -1) {
        if (errno == EINTR) return;
        pending.push_back(LaunchError{errnoMessage("poll() failed", errno)});
        closeStream(out);
        closeStream(err);
        return;
    }

    if (fds[count].revents != 0) {
        debug("ChildProcess: no longer reading output of pid {}", pid);
        closeStream(out);
        closeStream(err);
        return;
    }

    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
            readFrom(*streams[i]);
        }
    }
}

void ChildProcess::readFrom(Stream& stream) {
    auto buf = std::array<char, 4096>();
    const ssize_t len = read(stream.fd.get(), buf.data(), buf.size());
    if (len < 0) {
        if (errno == EINTR || errno == EAGAIN) return;
        pending.push_back(LaunchError{errnoMessage(stream.isStderr ? "read(stderr) failed" : "read(stdout) failed", errno)});
        closeStream(stream);
        return;
    }
    if (len == 0) {
        closeStream(stream);
        return;
    }

    stream.buffer.append(buf.data(), static_cast<size_t>(len));
    size_t pos = 0;
    while ((pos = stream.buffer.find('\n')) != std::string::npos) {
        emitLine(stream, std::string_view(stream.buffer).substr(0, pos + 1));
        stream.buffer.erase(0, pos + 1);
    }
}

void ChildProcess::emitLine(const Stream& stream, std::string_view line) {
    std::string bytes(text::stripLineEnding(line));
    if (stream.isStderr) {
        pending.push_back(StandardErrorLine{std::move(bytes)});
    } else {
        pending.push_back(StandardOutputLine{std::move(bytes)});
    }
}

void ChildProcess::closeStream(Stream& stream) {
    if (!stream.buffer.empty()) {
        // Last line without a trailing newline
        emitLine(stream, stream.buffer);
        stream.buffer.clear();
    }
    stream.fd.reset();
}

ProcessEvent ChildProcess::reap() {
    // Wait without reaping so signal() can't hit a recycled pid
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) == -1) {
        if (errno != EINTR) {
            return LaunchError{errnoMessage("waitid() failed", errno)};
        }
    }

    std::lock_guard<std::mutex> lock(reapMutex);
    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);
    reaped = true;

    if (waited == -1) {
        return LaunchError{errnoMessage("waitpid() failed", errno)};
    }

    Terminated terminated;
    if (WIFEXITED(status)) {
        terminated.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        terminated.signal = WTERMSIG(status);
    }
    return terminated;
}

bool ChildProcess::signal(int sig) {
    std::lock_guard<std::mutex> lock(reapMutex);
    if (pid <= 0 || reaped) {
        return false;
    }
    return signalGroup(sig);
}

bool ChildProcess::signalGroup(int sig) {
    // Falls back to the leader alone when it has left its group
    if (::kill(-pid, sig) == 0) {
        return true;
    }
    return ::kill(pid, sig) == 0;
}

void ChildProcess::stopReading() {
    const char byte = 1;
    ssize_t n = 0;
    do {
        n = write(wakeWrite.get(), &byte, sizeof(byte));
    } while (n == -1 && errno == EINTR);
    if (n == -1) {
        error("ChildProcess: failed to wake reader of pid {}: {}", pid, std::strerror(errno));
    }
}

pid_t ChildProcess::getPid() const {
    return pid;
}

bool ChildProcess::hasExited() const {
    std::lock_guard<std::mutex> lock(reapMutex);
    return reaped;
}

} // namespace configdesk
