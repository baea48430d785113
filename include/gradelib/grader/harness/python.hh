#pragma once

#include <chrono>
#include <gradelib/grader/harness/context.hh>
#include <gradelib/grader/types.hh>
#include <string_view>

namespace grader::harness {

/**
 * @brief Runs unittest test cases from @p tests against the module
 *   `solution` made of @p solution
 * @details The sources are saved as solution.py and test_solution.py in a
 *   fresh work directory, the test files are discovered by unittest and run
 *   by a verbose text runner. The whole run is bounded by @p timeout.
 *
 * @errors Failures of the runtime and of the submitted code are reported in
 *   the returned RunResult. Throws std::runtime_error only if a system call
 *   needed to run the interpreter fails.
 */
RunResult run_python_harness(
    const HarnessContext& ctx,
    std::string_view solution,
    std::string_view tests,
    std::chrono::milliseconds timeout
);

} // namespace grader::harness
