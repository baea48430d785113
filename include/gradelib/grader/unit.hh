#pragma once

#include <gradelib/grader/config.hh>
#include <gradelib/grader/types.hh>
#include <optional>
#include <string>
#include <string_view>

namespace grader {

/**
 * Unit protocol: every message is a single line of JSON terminated by '\n'.
 *   dispatcher -> unit:
 *     {"kind": "run", "req": RunRequest, "assetsBase"?: str, "config"?: Config}
 *   unit -> dispatcher: {"type": "result", "payload": RunResult}
 */
struct RunMessage {
    RunRequest req;
    std::optional<std::string> assets_base = std::nullopt;
    // Replaces the unit's own config for this run
    std::optional<Config> config = std::nullopt;
};

[[nodiscard]] std::string encode_run_message(const RunMessage& msg);

// Throws std::runtime_error if @p line is not a valid run message
[[nodiscard]] RunMessage decode_run_message(std::string_view line);

[[nodiscard]] std::string encode_result_message(const RunResult& res);

// Throws std::runtime_error if @p line is not a valid result message
[[nodiscard]] RunResult decode_result_message(std::string_view line);

/**
 * @brief Handles one run message inside an isolated unit
 * @details Resolves the language (detecting it if the request carries none),
 *   installs the network lockdown after the runtime bootstrap (if enabled)
 *   and runs the harness of the language. The config carried by the message
 *   takes precedence over @p config.
 *
 * @return The result, every exception is turned into runtime_error
 */
[[nodiscard]] RunResult handle_unit_message(std::string_view message, const Config& config);

/**
 * @brief Body of an isolated unit: reads one message from @p in_fd, handles
 *   it and writes the result message to @p out_fd
 *
 * @return Exit code for the unit process: 0 if the result was delivered
 */
int unit_main(int in_fd, int out_fd, const Config& config) noexcept;

} // namespace grader
