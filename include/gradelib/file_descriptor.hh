#pragma once

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

// Owns a file descriptor: closes it on destruction
class FileDescriptor {
    int fd_;

public:
    explicit FileDescriptor(int fd = -1) noexcept : fd_(fd) {}

    // Opens @p path, check is_open() for success
    FileDescriptor(const char* path, int flags, mode_t mode = 0644) noexcept
    : fd_(::open(path, flags, mode)) {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        reset(std::exchange(other.fd_, -1));
        return *this;
    }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    // Closes the owned descriptor (errors are ignored) and takes @p fd
    void reset(int fd) noexcept {
        if (fd_ >= 0) {
            (void)::close(fd_);
        }
        fd_ = fd;
    }

    // Returns the result of close(2), 0 if nothing was open
    [[nodiscard]] int close() noexcept { return fd_ < 0 ? 0 : ::close(std::exchange(fd_, -1)); }

    ~FileDescriptor() { reset(-1); }
};
