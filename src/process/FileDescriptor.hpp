#pragma once

#include <utility>
#include <unistd.h>

namespace configdesk {

// Owning wrapper around a POSIX file descriptor
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd(std::exchange(other.fd, -1)) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd, -1));
        }
        return *this;
    }

    void reset(int newFd = -1) {
        if (fd >= 0) {
            ::close(fd);
        }
        fd = newFd;
    }

    int get() const { return fd; }
    bool valid() const { return fd >= 0; }
    explicit operator bool() const { return valid(); }

private:
    int fd = -1;
};

} // namespace configdesk
