#pragma once

#include <chrono>
#include <gradelib/grader/harness/context.hh>
#include <gradelib/grader/types.hh>
#include <string_view>

namespace grader::harness {

// Runs the harness of @p lang
RunResult run_harness(
    Language lang,
    const HarnessContext& ctx,
    std::string_view solution,
    std::string_view tests,
    std::chrono::milliseconds timeout
);

} // namespace grader::harness
