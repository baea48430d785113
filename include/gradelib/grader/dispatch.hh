#pragma once

#include <chrono>
#include <gradelib/file_descriptor.hh>
#include <gradelib/grader/config.hh>
#include <gradelib/grader/types.hh>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <variant>

namespace grader {

enum class UnitVariant {
    INTERACTIVE, // fork()ed child of the calling process
    SERVER_HOSTED, // executed unit_executable program
};

/**
 * One isolated unit: a process (and its process group) with a message
 * channel. Destroying it kills the whole process group and reaps the
 * process.
 */
class Unit {
    pid_t pid_ = -1;
    FileDescriptor channel_;
    std::string exit_description_; // set by destroy()

    Unit(pid_t pid, FileDescriptor channel) noexcept
    : pid_(pid)
    , channel_(std::move(channel)) {}

public:
    // Forks a child that runs unit_main() over a socketpair
    static Unit spawn_interactive(const Config& config);

    // Executes config.unit_executable with a socket as its stdin and stdout
    static Unit spawn_server_hosted(const Config& config);

    Unit(const Unit&) = delete;
    Unit(Unit&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , channel_(std::move(other.channel_))
    , exit_description_(std::move(other.exit_description_)) {}

    Unit& operator=(const Unit&) = delete;
    Unit& operator=(Unit&&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    struct Timeout {};

    struct Fault {
        std::string description;
    };

    using Outcome = std::variant<RunResult, Timeout, Fault>;

    /**
     * @brief Sends @p message and waits for a single result message until
     *   @p deadline
     * @details A unit that closes the channel, dies or sends anything but a
     *   valid result message is a Fault. The unit is destroyed in that case.
     *
     * @errors Throws std::runtime_error if a system call fails
     */
    Outcome exchange(std::string_view message, std::chrono::steady_clock::time_point deadline);

    // Kills the process group of the unit and reaps the unit. Safe to call
    // more than once.
    void destroy() noexcept;

    // How the unit process ended (empty until destroy())
    [[nodiscard]] const std::string& exit_description() const noexcept {
        return exit_description_;
    }

    ~Unit() { destroy(); }
};

/**
 * @brief Runs @p req (with a resolved language) in a fresh unit of
 *   @p variant, bounded by req.timeout_ms (or config.default_timeout_ms)
 * @details The unit runs with @p config and keeps its work files in a run
 *   directory created from config.work_dir_template. The unit is destroyed
 *   and the run directory removed before returning. On timeout returns
 *   {success: false, output: "Timed out", error: timeout, timeout: true}, if
 *   the unit faults returns runtime_error with a diagnostic.
 *
 * @errors Throws std::runtime_error if the unit or its run directory cannot
 *   be created
 */
RunResult dispatch_to_unit(UnitVariant variant, const RunRequest& req, const Config& config);

} // namespace grader
