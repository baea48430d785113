#pragma once

#include <functional>
#include <gradelib/grader/config.hh>
#include <string>
#include <string_view>

namespace grader::harness {

struct HarnessContext {
    Config config;
    // Called after the runtime is bootstrapped and before any submitted code
    // runs
    std::function<void()> after_bootstrap = [] {};
};

/**
 * @brief Finds the executable of a runtime
 * @details Tries <assets_base>/bin/@p program first (if assets_base is set),
 *   then @p configured_path.
 *
 * @errors Throws std::runtime_error if none of them is an executable
 */
[[nodiscard]] std::string resolve_runtime(
    const HarnessContext& ctx, std::string_view program, const std::string& configured_path
);

// Appends '\n' to @p str if it does not end with it already
[[nodiscard]] std::string newline_terminated(std::string str);

} // namespace grader::harness
