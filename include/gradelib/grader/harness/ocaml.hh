#pragma once

#include <chrono>
#include <cstdint>
#include <gradelib/grader/harness/context.hh>
#include <gradelib/grader/types.hh>
#include <optional>
#include <string_view>

namespace grader::harness {

/**
 * @brief Compiles @p solution as module Solution and OUnit2 tests @p tests,
 *   links them to a bytecode executable and runs it
 * @details All steps share the budget @p timeout. A failed compilation or
 *   linking yields compile_error with the diagnostics.
 *
 * @errors Failures of the toolchain and of the submitted code are reported in
 *   the returned RunResult. Throws std::runtime_error only if a system call
 *   needed to run the toolchain fails.
 */
RunResult run_ocaml_harness(
    const HarnessContext& ctx,
    std::string_view solution,
    std::string_view tests,
    std::chrono::milliseconds timeout
);

struct OUnitSummary {
    uint64_t failures;
    uint64_t errors;

    friend bool operator==(const OUnitSummary&, const OUnitSummary&) = default;
};

/**
 * @brief Extracts test counts from the output of an OUnit test runner
 * @details Recognized (in this order): a "FAILED: ... Errors: E Failures: F"
 *   line, a "failures: F; errors: E" line, the last non-empty line being "OK".
 *
 * @return std::nullopt if no summary was found or the first recognized line
 *   has a count that does not fit in uint64_t
 */
[[nodiscard]] std::optional<OUnitSummary> parse_ounit_summary(std::string_view output);

} // namespace grader::harness
