#include <array>
#include <cstdint>
#include <fcntl.h>
#include <gradelib/errmsg.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/file_descriptor.hh>
#include <gradelib/macros/throw.hh>
#include <sys/types.h>
#include <unistd.h>

using std::array;
using std::string;

size_t write_all(int fd, const void* buf, size_t count) noexcept {
    ssize_t k = 0;
    size_t pos = 0;
    const auto* buff = static_cast<const uint8_t*>(buf);
    errno = 0;
    while (pos < count) {
        k = write(fd, buff + pos, count - pos);
        if (k >= 0) {
            pos += k;
        } else if (errno != EINTR) {
            return pos; // Error
        }
    }

    errno = 0; // No error (need to set again because errno may equal to EINTR)
    return count;
}

string get_file_contents(int fd) {
    string res;
    array<char, 65536> buff{};
    for (;;) {
        ssize_t len = read(fd, buff.data(), buff.size());
        // Interrupted by signal
        if (len < 0 && errno == EINTR) {
            continue;
        }
        // Error
        if (len < 0) {
            THROW("read() failed", errmsg());
        }
        // EOF
        if (len == 0) {
            break;
        }

        res.append(buff.data(), len);
    }

    return res;
}

string get_file_contents(const char* file) {
    FileDescriptor fd{file, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("Failed to open file `", file, '`', errmsg());
    }

    return get_file_contents(fd);
}

void put_file_contents(const char* file, std::string_view data, mode_t mode) {
    FileDescriptor fd{file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (not fd.is_open()) {
        THROW("Failed to open file `", file, '`', errmsg());
    }

    write_all_throw(fd, data);
    if (fd.close()) {
        THROW("close()", errmsg());
    }
}
