#pragma once

#include <chrono>
#include <gradelib/grader/harness/context.hh>
#include <gradelib/grader/types.hh>
#include <string>
#include <string_view>
#include <vector>

namespace grader::harness {

/**
 * @brief Runs describe()/test() test cases from @p tests against the CommonJS
 *   module @p solution in node
 * @details The solution is available to the tests through
 *   require('./solution') and as globals. toEqual() verdicts are computed by
 *   js::deep_equal() in this process. The whole run is bounded by @p timeout.
 *
 * @errors Failures of the runtime and of the submitted code are reported in
 *   the returned RunResult. Throws std::runtime_error if a system call fails
 *   or node sends a malformed matcher query.
 */
RunResult run_js_harness(
    const HarnessContext& ctx,
    std::string_view solution,
    std::string_view tests,
    std::chrono::milliseconds timeout
);

struct JsTestOutcome {
    std::string name;
    bool ok;
    std::string err; // failure stack, empty if ok
};

// "Ran N tests", one line per test, console output and the OK / FAILED
// summary; success iff no test failed
[[nodiscard]] RunResult
make_js_report(const std::vector<JsTestOutcome>& outcomes, const std::vector<std::string>& logs);

} // namespace grader::harness
