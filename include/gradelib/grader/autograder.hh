#pragma once

#include <future>
#include <gradelib/grader/config.hh>
#include <gradelib/grader/types.hh>

namespace grader {

/**
 * @brief Grades @p req in a fresh interactive (forked) unit
 * @details An explicit req.language bypasses detection. Detection failure
 *   yields bad_language_detection without creating a unit.
 *
 * @return The result, never throws
 */
[[nodiscard]] RunResult run_autograder(const RunRequest& req, const Config& config);

// Uses default_config()
[[nodiscard]] RunResult run_autograder(const RunRequest& req);

// Like run_autograder() but the unit is a separately executed process
[[nodiscard]] RunResult run_in_server(const RunRequest& req, const Config& config);

// Uses default_config()
[[nodiscard]] RunResult run_in_server(const RunRequest& req);

// The future is resolved exactly once with the result of run_autograder()
[[nodiscard]] std::future<RunResult> run_autograder_async(RunRequest req, Config config);

[[nodiscard]] std::future<RunResult> run_autograder_async(RunRequest req);

// The future is resolved exactly once with the result of run_in_server()
[[nodiscard]] std::future<RunResult> run_in_server_async(RunRequest req, Config config);

[[nodiscard]] std::future<RunResult> run_in_server_async(RunRequest req);

} // namespace grader
