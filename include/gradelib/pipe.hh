#pragma once

#include <gradelib/file_descriptor.hh>
#include <optional>
#include <sys/socket.h>
#include <unistd.h>

struct Pipe {
    FileDescriptor readable;
    FileDescriptor writable;
};

// Returns std::nullopt on error with errno set appropriately
inline std::optional<Pipe> pipe2(int flags) noexcept {
    int pfd[2];
    int rc = ::pipe2(pfd, flags);
    if (rc) {
        return std::nullopt;
    }
    return Pipe{
        .readable = FileDescriptor{pfd[0]},
        .writable = FileDescriptor{pfd[1]},
    };
}

struct SocketPair {
    FileDescriptor our_end;
    FileDescriptor other_end;
};

// Returns std::nullopt on error with errno set appropriately
inline std::optional<SocketPair> unix_socketpair(int type) noexcept {
    int sfd[2];
    int rc = ::socketpair(AF_UNIX, type, 0, sfd);
    if (rc) {
        return std::nullopt;
    }
    return SocketPair{
        .our_end = FileDescriptor{sfd[0]},
        .other_end = FileDescriptor{sfd[1]},
    };
}
