#include <exception>
#include <gradelib/file_contents.hh>
#include <gradelib/grader/harness/python.hh>
#include <gradelib/logger.hh>
#include <gradelib/spawner.hh>
#include <gradelib/temporary_directory.hh>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using std::string;
using std::string_view;

namespace {

constexpr string_view driver_script = R"(
import io, sys, unittest, importlib, json, traceback
work_dir = sys.argv[1]
sys.path.insert(0, work_dir)
importlib.invalidate_caches()

buf = io.StringIO()
try:
    import solution
except Exception:
    print("IMPORT_ERROR_START", flush=True)
    traceback.print_exc()
    print("IMPORT_ERROR_END", flush=True)
    raise

suite = unittest.TestLoader().discover(work_dir, pattern="test_*.py", top_level_dir=work_dir)
res = unittest.TextTestRunner(stream=buf, verbosity=2).run(suite)
out = {
    "testsRun": res.testsRun,
    "failures": len(res.failures),
    "errors": len(res.errors),
    "text": buf.getvalue(),
}
print("REPORT_JSON_START")
print(json.dumps(out))
print("REPORT_JSON_END")
)";

constexpr string_view REPORT_BEGIN = "REPORT_JSON_START";
constexpr string_view REPORT_END = "REPORT_JSON_END";

// Text between the report sentinels (with surrounding white-spaces removed)
std::optional<string_view> extract_report(string_view out) {
    size_t beg = out.find(REPORT_BEGIN);
    if (beg == string_view::npos) {
        return std::nullopt;
    }
    beg += REPORT_BEGIN.size();
    size_t end = out.find(REPORT_END, beg);
    if (end == string_view::npos) {
        return std::nullopt;
    }
    auto report = out.substr(beg, end - beg);
    auto is_space = [](char c) { return c == ' ' or c == '\n' or c == '\r' or c == '\t'; };
    while (not report.empty() and is_space(report.front())) {
        report.remove_prefix(1);
    }
    while (not report.empty() and is_space(report.back())) {
        report.remove_suffix(1);
    }
    return report;
}

bool contains(string_view str, string_view what) noexcept {
    return str.find(what) != string_view::npos;
}

} // namespace

namespace grader::harness {

RunResult run_python_harness(
    const HarnessContext& ctx,
    string_view solution,
    string_view tests,
    std::chrono::milliseconds timeout
) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto timeout_ms = static_cast<uint64_t>(timeout.count());

    string python;
    TemporaryDirectory work_dir;
    try {
        python = resolve_runtime(ctx, "python3", ctx.config.python_executable);
        work_dir = TemporaryDirectory{ctx.config.work_dir_template};
    } catch (const std::exception& e) {
        errlog("Python harness: bootstrap failed: ", e.what());
        return result_fail(
            concat_tostr("Failed to initialize Python runtime: ", e.what()),
            ErrorKind::RUNTIME_ERROR
        );
    }

    try {
        put_file_contents(work_dir.path() + "solution.py", solution);
        put_file_contents(work_dir.path() + "test_solution.py", tests);
    } catch (const std::exception& e) {
        return result_fail(
            concat_tostr("Failed to materialize files: ", e.what()), ErrorKind::RUNTIME_ERROR
        );
    }

    ctx.after_bootstrap();

    auto res = Spawner::run(
        python,
        {"python3", "-I", "-B", "-c", string{driver_script}, work_dir.path()},
        {
            .working_dir = work_dir.path(),
            .deadline = deadline,
        }
    );
    const string& out = res.stdout_data;
    const string& err = res.stderr_data;

    if (res.exit_stat.timed_out) {
        return result_run_timeout(timeout_ms);
    }

    if (not res.exit_stat.exited_successfully()) {
        if (contains(out, "IMPORT_ERROR_START") or contains(err, "SyntaxError")) {
            return result_fail(
                not err.empty() ? err : not out.empty() ? out : res.exit_stat.message,
                ErrorKind::COMPILE_ERROR
            );
        }
        return result_fail(
            not err.empty() ? err
                : not out.empty() ? out
                                  : concat_tostr("Python process ", res.exit_stat.message),
            ErrorKind::RUNTIME_ERROR
        );
    }

    auto report_text = extract_report(out);
    if (not report_text) {
        const string& txt = not out.empty() ? out : err;
        if (contains(txt, "FAILED") or contains(txt, "Failure") or
            contains(txt, "AssertionError"))
        {
            return result_fail(txt, ErrorKind::TESTS_FAILED);
        }
        return result_fail(
            txt.empty() ? "Unknown failure (no report parsed)" : txt, ErrorKind::RUNTIME_ERROR
        );
    }

    uint64_t failures = 0;
    uint64_t errors = 0;
    string text;
    try {
        auto report = nlohmann::json::parse(*report_text);
        failures = report.value("failures", uint64_t{0});
        errors = report.value("errors", uint64_t{0});
        text = report.value("text", "");
    } catch (const nlohmann::json::exception& e) {
        return result_fail(
            concat_tostr("Failed to parse report: ", e.what(), '\n', out), ErrorKind::RUNTIME_ERROR
        );
    }

    if (failures == 0 and errors == 0) {
        return result_ok(newline_terminated(std::move(text)));
    }
    return result_fail(newline_terminated(std::move(text)), ErrorKind::TESTS_FAILED);
}

} // namespace grader::harness
