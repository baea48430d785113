#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdio>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdint>
#include <csignal>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <gradelib/call_in_destructor.hh>
#include <gradelib/concat_tostr.hh>
#include <gradelib/errmsg.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/file_descriptor.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/pipe.hh>
#include <gradelib/spawner.hh>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

using std::array;
using std::string;
using std::vector;

namespace {

// glibc has no wrapper for it before 2.36
int pidfd_open(pid_t pid) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
}

// File descriptors are moved above this number before being placed at their
// destination numbers, so that they do not clobber each other
constexpr int HIGH_FD_BASE = 64;

struct Stream {
    int fd;
    string* data;
    bool eof = false;
};

// Reads what is available in @p stream, returns false on EOF
bool read_available(Stream& stream, size_t limit) {
    array<char, 65536> buff{};
    ssize_t rc = read(stream.fd, buff.data(), buff.size());
    if (rc < 0) {
        if (errno == EINTR or errno == EAGAIN) {
            return true;
        }
        THROW("read()", errmsg());
    }
    if (rc == 0) {
        stream.eof = true;
        return false;
    }
    if (stream.data->size() < limit) {
        stream.data->append(buff.data(), std::min<size_t>(rc, limit - stream.data->size()));
    }
    return true;
}

} // namespace

string Spawner::describe_si(int code, int status) {
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return concat_tostr("killed by signal ", status, " - ", strsignal(status));
    case CLD_DUMPED:
        return concat_tostr("killed and dumped by signal ", status, " - ", strsignal(status));
    default: THROW("Invalid siginfo_t.si_code: ", code);
    }
}

void Spawner::send_error_message_and_exit(int fd, int errnum, std::string_view str) noexcept {
    // Nothing can be done about errors here
    (void)write_all(fd, str.data(), str.size());
    if (errnum != 0) {
        auto msg = errmsg(errnum);
        (void)write_all(fd, msg.data(), msg.size());
    }
    _exit(-1);
}

Spawner::Result Spawner::run(
    const string& exec, const vector<string>& exec_args, const Spawner::Options& opts
) {
    using std::chrono::steady_clock;

    // Arguments have to be converted before fork(), allocation is not safe
    // after forking a multithreaded process
    vector<char*> argv;
    argv.reserve(exec_args.size() + 1);
    for (const auto& arg : exec_args) {
        argv.emplace_back(const_cast<char*>(arg.c_str()));
    }
    argv.emplace_back(nullptr);

    auto stdout_pipe = pipe2(O_CLOEXEC | O_NONBLOCK);
    if (not stdout_pipe) {
        THROW("pipe2()", errmsg());
    }
    auto stderr_pipe = pipe2(O_CLOEXEC | O_NONBLOCK);
    if (not stderr_pipe) {
        THROW("pipe2()", errmsg());
    }
    // Error stream from child
    auto error_pipe = pipe2(O_CLOEXEC);
    if (not error_pipe) {
        THROW("pipe2()", errmsg());
    }

    // The child needs blocking ends
    if (fcntl(stdout_pipe->writable, F_SETFL, 0) or fcntl(stderr_pipe->writable, F_SETFL, 0)) {
        THROW("fcntl()", errmsg());
    }

    Options child_opts = opts;
    child_opts.inherited_fds.emplace_back(stdout_pipe->writable, STDOUT_FILENO);
    child_opts.inherited_fds.emplace_back(stderr_pipe->writable, STDERR_FILENO);

    auto start = steady_clock::now();
    pid_t parent_pid = getpid();
    pid_t cpid = fork();
    if (cpid == -1) {
        THROW("fork()", errmsg());
    }
    if (cpid == 0) {
        (void)error_pipe->readable.close();
        run_child(exec.c_str(), argv.data(), child_opts, error_pipe->writable, parent_pid);
    }

    siginfo_t si{};
    // Useful when exception is thrown
    CallInDtor kill_and_wait_child_guard([&]() noexcept {
        (void)kill(cpid, SIGKILL);
        (void)waitid(P_PID, cpid, &si, WEXITED);
    });

    (void)stdout_pipe->writable.close();
    (void)stderr_pipe->writable.close();
    (void)error_pipe->writable.close();

    FileDescriptor pidfd{pidfd_open(cpid)};
    if (not pidfd.is_open()) {
        THROW("pidfd_open()", errmsg());
    }

    Result res;
    array streams = {
        Stream{.fd = stdout_pipe->readable, .data = &res.stdout_data},
        Stream{.fd = stderr_pipe->readable, .data = &res.stderr_data},
    };
    string error_message;
    bool error_pipe_eof = false;
    vector<Watch> watches = opts.watches;
    auto deadline = opts.deadline;
    bool child_dead = false;

    for (;;) {
        vector<pollfd> pfds;
        // Indexes: 0, 1 - streams, 2 - error pipe, 3 - pidfd, 4... - watches
        for (auto& stream : streams) {
            pfds.push_back({.fd = stream.eof ? -1 : stream.fd, .events = POLLIN, .revents = 0});
        }
        pfds.push_back({
            .fd = error_pipe_eof ? -1 : int(error_pipe->readable),
            .events = POLLIN,
            .revents = 0,
        });
        pfds.push_back({.fd = child_dead ? -1 : int(pidfd), .events = POLLIN, .revents = 0});
        for (auto& watch : watches) {
            pfds.push_back({.fd = watch.fd, .events = POLLIN, .revents = 0});
        }

        int timeout_ms = -1;
        if (child_dead) {
            timeout_ms = 0; // only drain what is already there
        } else if (deadline) {
            auto now = steady_clock::now();
            if (now >= *deadline) {
                (void)kill(cpid, SIGKILL);
                res.exit_stat.timed_out = true;
                deadline = std::nullopt;
                continue;
            }
            timeout_ms = static_cast<int>(std::min<int64_t>(
                std::chrono::ceil<std::chrono::milliseconds>(*deadline - now).count(), INT_MAX
            ));
        }

        int rc = poll(pfds.data(), pfds.size(), timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        if (rc == 0) {
            if (child_dead) {
                break;
            }
            continue; // deadline is handled at the beginning of the loop
        }

        bool progress = false;
        for (size_t i = 0; i < streams.size(); ++i) {
            if (pfds[i].revents != 0) {
                (void)read_available(streams[i], opts.output_limit_in_bytes);
                progress = true;
            }
        }
        if (pfds[2].revents != 0) {
            array<char, 4096> buff{};
            ssize_t len = read(error_pipe->readable, buff.data(), buff.size());
            if (len > 0) {
                error_message.append(buff.data(), len);
            } else if (len == 0 or errno != EINTR) {
                error_pipe_eof = true;
            }
            progress = true;
        }
        if (pfds[3].revents != 0) {
            child_dead = true;
            progress = true;
        }
        // Iterate backwards, because removing shifts the later watches
        bool watch_progress = false;
        for (size_t j = watches.size(); j-- > 0;) {
            if (pfds[4 + j].revents != 0) {
                watch_progress = true;
                if (not watches[j].on_readable(watches[j].fd)) {
                    watches.erase(watches.begin() + static_cast<ptrdiff_t>(j));
                }
            }
        }

        // Watches are drained completely, even after the outputs are closed
        bool all_closed = streams[0].eof and streams[1].eof and error_pipe_eof;
        if (child_dead and not watch_progress and (all_closed or not progress)) {
            break;
        }
    }

    kill_and_wait_child_guard.cancel();
    if (waitid(P_PID, cpid, &si, WEXITED) == -1) {
        THROW("waitid()", errmsg());
    }
    res.exit_stat.runtime = steady_clock::now() - start;

    if (not error_message.empty()) { // Error in the child before exec
        THROW(error_message);
    }

    res.exit_stat.si.code = si.si_code;
    res.exit_stat.si.status = si.si_status;
    res.exit_stat.message = describe_si(si.si_code, si.si_status);
    return res;
}

void Spawner::run_child(
    const char* exec, char* const* argv, const Options& opts, int fd, pid_t parent_pid
) noexcept {
    // Keep the error stream away from the numbers of the inherited descriptors
    if (int high_fd = fcntl(fd, F_DUPFD_CLOEXEC, HIGH_FD_BASE); high_fd != -1) {
        fd = high_fd;
    } else {
        send_error_message_and_exit(fd, errno, "fcntl(F_DUPFD_CLOEXEC)");
    }

    // Sends error to parent
    auto send_error_and_exit = [fd](int errnum, std::string_view str) {
        send_error_message_and_exit(fd, errnum, str);
    };

    if (prctl(PR_SET_PDEATHSIG, SIGKILL)) {
        send_error_and_exit(errno, "prctl(PR_SET_PDEATHSIG)");
    }
    if (getppid() != parent_pid) {
        _exit(-1); // Parent is already dead
    }

    if (not opts.working_dir.empty() and chdir(opts.working_dir.c_str()) == -1) {
        send_error_and_exit(errno, "chdir()");
    }

    // Change stdin
    {
        int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd == -1) {
            send_error_and_exit(errno, "open(/dev/null)");
        }
        if (dup2(null_fd, STDIN_FILENO) == -1) {
            send_error_and_exit(errno, "dup2()");
        }
        (void)close(null_fd);
    }

    // Move the inherited descriptors out of the way first, then put them in
    // their places (dup2() clears FD_CLOEXEC on the new descriptor)
    constexpr size_t MAX_INHERITED_FDS = 32;
    int moved[MAX_INHERITED_FDS];
    if (opts.inherited_fds.size() > MAX_INHERITED_FDS) {
        send_error_and_exit(0, "Too many inherited file descriptors");
    }
    for (size_t i = 0; i < opts.inherited_fds.size(); ++i) {
        moved[i] = fcntl(opts.inherited_fds[i].first, F_DUPFD_CLOEXEC, HIGH_FD_BASE);
        if (moved[i] == -1) {
            send_error_and_exit(errno, "fcntl(F_DUPFD_CLOEXEC)");
        }
    }
    for (size_t i = 0; i < opts.inherited_fds.size(); ++i) {
        while (dup2(moved[i], opts.inherited_fds[i].second) == -1) {
            if (errno != EINTR) {
                send_error_and_exit(errno, "dup2()");
            }
        }
    }

    auto is_permitted = [&](int fd_no) {
        if (fd_no == STDIN_FILENO or fd_no == fd) {
            return true;
        }
        for (const auto& [from, to] : opts.inherited_fds) {
            if (fd_no == to) {
                return true;
            }
        }
        return false;
    };

    // Close file descriptors that are not needed to be open
    {
        DIR* dir = opendir("/proc/self/fd");
        if (dir == nullptr) {
            send_error_and_exit(errno, "opendir()");
        }
        int dir_fd = dirfd(dir);
        while (dirent* file = readdir(dir)) {
            char* end = nullptr;
            long fd_no = strtol(file->d_name, &end, 10);
            if (end == file->d_name or *end != '\0') {
                continue; // . and ..
            }
            if (fd_no != dir_fd and not is_permitted(static_cast<int>(fd_no))) {
                (void)close(static_cast<int>(fd_no));
            }
        }
        (void)closedir(dir);
    }

    execv(exec, argv);
    int errnum = errno;
    // execv() failed
    array<char, 4200> msg{};
    int len = snprintf(msg.data(), msg.size(), "execv('%s')", exec);
    send_error_and_exit(
        errnum, std::string_view{msg.data(), std::min<size_t>(std::max(len, 0), msg.size() - 1)}
    );
}
