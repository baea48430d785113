#pragma once

#include <chrono>
#include <csignal>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

class Spawner {
protected:
    Spawner() = default;

public:
    struct ExitStat {
        std::chrono::nanoseconds runtime{0};

        struct {
            int code; // si_code field from siginfo_t from waitid(2)
            int status; // si_status field from siginfo_t from waitid(2)
        } si{};

        bool timed_out = false; // process was killed because of the deadline
        std::string message;

        [[nodiscard]] bool exited_successfully() const noexcept {
            return si.code == CLD_EXITED and si.status == 0;
        }

        // Exit code or 128 + signal number (like shells do)
        [[nodiscard]] int exit_code() const noexcept {
            return si.code == CLD_EXITED ? si.status : 128 + si.status;
        }
    };

    struct Watch {
        int fd;
        // Called when @p fd becomes readable or hung up. Returning false removes the watch.
        // Watches are polled until they have nothing more to read after the process exits.
        std::function<bool(int fd)> on_readable;
    };

    struct Options {
        std::string working_dir; // empty - do not change working directory
        std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt;
        // (fd in this process, fd number in the spawned process), stdin is always /dev/null
        std::vector<std::pair<int, int>> inherited_fds = {};
        // Polled together with stdout and stderr of the spawned process
        std::vector<Watch> watches = {};
        size_t output_limit_in_bytes = 16 << 20; // per stream, the rest is discarded
    };

    struct Result {
        ExitStat exit_stat;
        std::string stdout_data;
        std::string stderr_data;
    };

    /**
     * @brief Runs @p exec with arguments @p exec_args and waits for it to exit
     *   or for the deadline to pass, collecting its stdout and stderr
     * @details @p exec is called via execv(), so it has to be a path.
     *   The spawned process stays in the process group of the caller and
     *   receives SIGKILL if the caller dies (PR_SET_PDEATHSIG). On deadline it
     *   is killed with SIGKILL and exit_stat.timed_out is set.
     *
     * @errors Throws an exception std::runtime_error with appropriate
     *   information if any syscall fails or if the process could not be
     *   executed. Exceptions thrown by watches are propagated after the
     *   process is killed and waited.
     */
    static Result run(
        const std::string& exec, const std::vector<std::string>& exec_args, const Options& opts
    );

    // Returns "exited with <code>" or "killed by signal <sig> - <description>"
    static std::string describe_si(int code, int status);

protected:
    // Sends @p str followed by error message of @p errnum through @p fd and
    // _exits with -1
    [[noreturn]] static void
    send_error_message_and_exit(int fd, int errnum, std::string_view str) noexcept;

    /**
     * @brief Initializes child process which will execute @p exec, this
     *   function does not return (it kills the process instead)!
     *
     * @param exec filename that is to be executed
     * @param argv null-terminated arguments passed to exec
     * @param opts options
     * @param fd file descriptor to which errors will be written
     * @param parent_pid pid of the process that forked
     */
    [[noreturn]] static void run_child(
        const char* exec, char* const* argv, const Options& opts, int fd, pid_t parent_pid
    ) noexcept;
};
