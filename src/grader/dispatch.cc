#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <csignal>
#include <dirent.h>
#include <fcntl.h>
#include <gradelib/concat_tostr.hh>
#include <gradelib/errmsg.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/grader/dispatch.hh>
#include <gradelib/grader/unit.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/pipe.hh>
#include <gradelib/spawner.hh>
#include <gradelib/temporary_directory.hh>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

using std::string;
using std::string_view;
using std::chrono::steady_clock;

namespace {

// Called in the forked child: makes it the leader of its own process group
// that dies together with the parent
void become_unit_process(pid_t parent_pid) noexcept {
    (void)setpgid(0, 0);
    if (prctl(PR_SET_PDEATHSIG, SIGKILL) or getppid() != parent_pid) {
        _exit(1);
    }
}

// Closes all file descriptors above stderr except @p keep and log files
void close_other_fds(int keep) noexcept {
    DIR* dir = opendir("/proc/self/fd");
    if (dir == nullptr) {
        return;
    }
    int dir_fd = dirfd(dir);
    while (dirent* file = readdir(dir)) {
        char* end = nullptr;
        long fd = strtol(file->d_name, &end, 10);
        if (end == file->d_name or *end != '\0' or fd <= STDERR_FILENO) {
            continue;
        }
        if (fd != keep and fd != dir_fd and fd != stdlog.fileno() and fd != errlog.fileno()) {
            (void)close(static_cast<int>(fd));
        }
    }
    (void)closedir(dir);
}

} // namespace

namespace grader {

Unit Unit::spawn_interactive(const Config& config) {
    auto channel = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    if (not channel) {
        THROW("socketpair()", errmsg());
    }

    pid_t parent_pid = getpid();
    pid_t pid = fork();
    if (pid == -1) {
        THROW("fork()", errmsg());
    }
    if (pid == 0) {
        become_unit_process(parent_pid);
        close_other_fds(channel->other_end);
        _exit(unit_main(channel->other_end, channel->other_end, config));
    }

    (void)setpgid(pid, pid); // fails harmlessly if the child has already exec-ed or exited
    (void)channel->other_end.close();
    stdlog("Spawned interactive unit ", pid);
    return Unit{pid, std::move(channel->our_end)};
}

Unit Unit::spawn_server_hosted(const Config& config) {
    auto channel = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    if (not channel) {
        THROW("socketpair()", errmsg());
    }
    // Error stream from the child, closed on successful exec
    auto error_pipe = pipe2(O_CLOEXEC);
    if (not error_pipe) {
        THROW("pipe2()", errmsg());
    }

    const char* exec = config.unit_executable.c_str();
    char* const argv[] = {const_cast<char*>(exec), nullptr};

    pid_t parent_pid = getpid();
    pid_t pid = fork();
    if (pid == -1) {
        THROW("fork()", errmsg());
    }
    if (pid == 0) {
        become_unit_process(parent_pid);
        auto send_error_and_exit = [&](string_view what) {
            int errnum = errno;
            (void)write_all(error_pipe->writable, what.data(), what.size());
            auto msg = errmsg(errnum);
            (void)write_all(error_pipe->writable, msg.data(), msg.size());
            _exit(127);
        };
        if (dup2(channel->other_end, STDIN_FILENO) == -1 or
            dup2(channel->other_end, STDOUT_FILENO) == -1)
        {
            send_error_and_exit("dup2()");
        }
        execvp(exec, argv);
        send_error_and_exit(concat_tostr("execvp('", exec, "')"));
    }

    (void)setpgid(pid, pid);
    (void)channel->other_end.close();
    (void)error_pipe->writable.close();
    Unit unit{pid, std::move(channel->our_end)};

    // Blocks until the exec succeeds (or fails)
    auto error_message = get_file_contents(error_pipe->readable);
    if (not error_message.empty()) {
        THROW("Cannot start unit: ", error_message);
    }
    stdlog("Spawned server-hosted unit ", pid, " (", config.unit_executable, ')');
    return unit;
}

Unit::Outcome Unit::exchange(string_view message, steady_clock::time_point deadline) {
    if (fcntl(channel_, F_SETFL, O_NONBLOCK) == -1) {
        THROW("fcntl()", errmsg());
    }

    auto terminated = [&] {
        destroy();
        return Fault{concat_tostr("Isolated unit terminated unexpectedly: ", exit_description_)};
    };

    size_t sent = 0;
    string received;
    for (;;) {
        auto now = steady_clock::now();
        if (now >= deadline) {
            return Timeout{};
        }
        auto timeout_ms = std::min<int64_t>(
            std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count(), INT_MAX
        );

        pollfd pfd = {
            .fd = channel_,
            .events = static_cast<short>(POLLIN | (sent < message.size() ? POLLOUT : 0)),
            .revents = 0,
        };
        int rc = poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        if (rc == 0) {
            continue;
        }

        if ((pfd.revents & POLLOUT) and sent < message.size()) {
            ssize_t len = send(
                channel_, message.data() + sent, message.size() - sent, MSG_NOSIGNAL | MSG_DONTWAIT
            );
            if (len >= 0) {
                sent += len;
            } else if (errno == EPIPE or errno == ECONNRESET) {
                return terminated();
            } else if (errno != EAGAIN and errno != EINTR) {
                THROW("send()", errmsg());
            }
        }

        if (pfd.revents & (POLLIN | POLLHUP | POLLERR)) {
            char buff[65536];
            ssize_t len = read(channel_, buff, sizeof(buff));
            if (len < 0 and errno != EAGAIN and errno != EINTR) {
                if (errno != ECONNRESET) {
                    THROW("read()", errmsg());
                }
                len = 0;
            }
            if (len == 0) {
                return terminated();
            }
            if (len > 0) {
                received.append(buff, len);
            }
            if (auto eol = received.find('\n'); eol != string::npos) {
                received.resize(eol);
                try {
                    return decode_result_message(received);
                } catch (const std::runtime_error& e) {
                    destroy();
                    return Fault{concat_tostr("Isolated unit sent an invalid message: ", e.what())};
                }
            }
        }
    }
}

void Unit::destroy() noexcept {
    if (pid_ <= 0) {
        return;
    }
    (void)kill(-pid_, SIGKILL);
    (void)kill(pid_, SIGKILL);

    siginfo_t si{};
    int rc = 0;
    do {
        rc = waitid(P_PID, pid_, &si, WEXITED);
    } while (rc == -1 and errno == EINTR);

    if (rc == 0) {
        switch (si.si_code) {
        case CLD_EXITED:
        case CLD_KILLED:
        case CLD_DUMPED: exit_description_ = Spawner::describe_si(si.si_code, si.si_status); break;
        default: exit_description_ = "unknown exit status"; break;
        }
    } else {
        exit_description_ = concat_tostr("waitid() failed", errmsg());
    }
    stdlog("Unit ", pid_, " destroyed, it ", exit_description_);
    pid_ = -1;
    channel_.reset(-1);
}

RunResult dispatch_to_unit(UnitVariant variant, const RunRequest& req, const Config& config) {
    const uint64_t timeout_ms = req.timeout_ms.value_or(config.default_timeout_ms);
    auto deadline = steady_clock::now() + std::chrono::milliseconds{timeout_ms};

    // Everything the unit writes lives here, so it is removed even if the
    // unit is killed
    TemporaryDirectory run_dir{config.work_dir_template};
    Config unit_config = config;
    unit_config.work_dir_template = run_dir.path() + "work.XXXXXX";

    auto unit = variant == UnitVariant::INTERACTIVE ? Unit::spawn_interactive(config)
                                                    : Unit::spawn_server_hosted(config);
    const pid_t pid = unit.pid();

    RunMessage msg{.req = req, .config = std::move(unit_config)};
    if (not config.assets_base.empty()) {
        msg.assets_base = config.assets_base;
    }
    auto outcome = unit.exchange(encode_run_message(msg), deadline);
    unit.destroy();

    if (auto* res = std::get_if<RunResult>(&outcome)) {
        return std::move(*res);
    }
    if (std::holds_alternative<Unit::Timeout>(outcome)) {
        stdlog("Unit ", pid, " timed out after ", timeout_ms, " ms");
        return result_fail("Timed out", ErrorKind::TIMEOUT);
    }
    auto& fault = std::get<Unit::Fault>(outcome);
    errlog("Unit ", pid, ": ", fault.description);
    return result_fail(std::move(fault.description), ErrorKind::RUNTIME_ERROR);
}

} // namespace grader
