#include <gradelib/grader/harness/js.hh>
#include <gradelib/grader/harness/ocaml.hh>
#include <gradelib/grader/harness/python.hh>
#include <gradelib/grader/harness/run_harness.hh>

namespace grader::harness {

RunResult run_harness(
    Language lang,
    const HarnessContext& ctx,
    std::string_view solution,
    std::string_view tests,
    std::chrono::milliseconds timeout
) {
    switch (lang) {
    case Language::JS: return run_js_harness(ctx, solution, tests, timeout);
    case Language::PYTHON: return run_python_harness(ctx, solution, tests, timeout);
    case Language::OCAML: return run_ocaml_harness(ctx, solution, tests, timeout);
    }
    __builtin_unreachable();
}

} // namespace grader::harness
