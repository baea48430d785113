#include <charconv>
#include <exception>
#include <gradelib/file_contents.hh>
#include <gradelib/grader/harness/ocaml.hh>
#include <gradelib/logger.hh>
#include <gradelib/spawner.hh>
#include <gradelib/temporary_directory.hh>
#include <regex>
#include <string>
#include <vector>

using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace {

vector<string_view> split_lines(string_view text) {
    vector<string_view> lines;
    while (not text.empty()) {
        size_t eol = text.find('\n');
        lines.emplace_back(text.substr(0, eol));
        if (eol == string_view::npos) {
            break;
        }
        text.remove_prefix(eol + 1);
    }
    return lines;
}

string_view trim(string_view str) noexcept {
    auto is_space = [](char c) { return c == ' ' or c == '\t' or c == '\r' or c == '\n'; };
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

// std::nullopt if a count does not fit in uint64_t
optional<grader::harness::OUnitSummary>
make_summary(const std::csub_match& failures, const std::csub_match& errors) noexcept {
    auto to_count = [](const std::csub_match& m) -> optional<uint64_t> {
        uint64_t res = 0;
        auto [ptr, ec] = std::from_chars(m.first, m.second, res);
        if (ec != std::errc{} or ptr != m.second) {
            return std::nullopt;
        }
        return res;
    };
    auto f = to_count(failures);
    auto e = to_count(errors);
    if (not f or not e) {
        return std::nullopt;
    }
    return grader::harness::OUnitSummary{.failures = *f, .errors = *e};
}

// Toolchain diagnostics: trimmed stderr, else stdout, newline-terminated
string diagnostics(const Spawner::Result& res) {
    auto diag = trim(res.stderr_data);
    if (diag.empty()) {
        diag = trim(res.stdout_data);
    }
    return concat_tostr(diag, '\n');
}

} // namespace

namespace grader::harness {

optional<OUnitSummary> parse_ounit_summary(string_view output) {
    static const std::regex failed_line(
        R"(FAILED:\s*(?:.*\s)?errors:\s*(\d+)\s+failures:\s*(\d+))", std::regex::icase
    );
    static const std::regex counts_line(
        R"(failures:\s*(\d+)\s*;\s*errors:\s*(\d+))", std::regex::icase
    );

    auto lines = split_lines(output);
    for (auto line : lines) {
        std::cmatch m;
        if (std::regex_search(line.data(), line.data() + line.size(), m, failed_line)) {
            return make_summary(m[2], m[1]);
        }
    }
    for (auto line : lines) {
        std::cmatch m;
        if (std::regex_search(line.data(), line.data() + line.size(), m, counts_line)) {
            return make_summary(m[1], m[2]);
        }
    }
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        auto line = trim(*it);
        if (line.empty()) {
            continue;
        }
        if (line == "OK") {
            return OUnitSummary{.failures = 0, .errors = 0};
        }
        break;
    }
    return std::nullopt;
}

RunResult run_ocaml_harness(
    const HarnessContext& ctx,
    string_view solution,
    string_view tests,
    std::chrono::milliseconds timeout
) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto timeout_ms = static_cast<uint64_t>(timeout.count());

    string ocamlfind;
    string ocamlrun;
    TemporaryDirectory work_dir;
    try {
        ocamlfind = resolve_runtime(ctx, "ocamlfind", ctx.config.ocamlfind_executable);
        ocamlrun = resolve_runtime(ctx, "ocamlrun", ctx.config.ocamlrun_executable);
        work_dir = TemporaryDirectory{ctx.config.work_dir_template};
    } catch (const std::exception& e) {
        errlog("OCaml harness: bootstrap failed: ", e.what());
        return result_fail(
            concat_tostr("Failed to initialize OCaml runtime: ", e.what()),
            ErrorKind::RUNTIME_ERROR
        );
    }

    try {
        put_file_contents(work_dir.path() + "Solution.ml", solution);
        put_file_contents(work_dir.path() + "test_solution.ml", tests);
    } catch (const std::exception& e) {
        return result_fail(
            concat_tostr("Failed to materialize OCaml files: ", e.what()),
            ErrorKind::RUNTIME_ERROR
        );
    }

    ctx.after_bootstrap();

    const string& dir = work_dir.path();
    auto run = [&](const string& exec, vector<string> argv) {
        return Spawner::run(exec, argv, {.working_dir = dir, .deadline = deadline});
    };

    const vector<vector<string>> build_steps = {
        {"ocamlfind", "ocamlc", "-I", dir, "-c", "Solution.ml"},
        {"ocamlfind", "ocamlc", "-I", dir, "-package", "ounit2", "-c", "test_solution.ml"},
        {"ocamlfind",
         "ocamlc",
         "-I",
         dir,
         "-package",
         "unix,str,ounit2",
         "-linkpkg",
         "-o",
         "a.byte",
         "Solution.cmo",
         "test_solution.cmo"},
    };
    for (const auto& argv : build_steps) {
        auto res = run(ocamlfind, argv);
        if (res.exit_stat.timed_out) {
            return result_run_timeout(timeout_ms);
        }
        if (not res.exit_stat.exited_successfully()) {
            return result_fail(diagnostics(res), ErrorKind::COMPILE_ERROR);
        }
    }

    auto res = run(ocamlrun, {"ocamlrun", dir + "a.byte"});
    if (res.exit_stat.timed_out) {
        return result_run_timeout(timeout_ms);
    }

    string raw_out = res.stdout_data + res.stderr_data;
    auto summary = parse_ounit_summary(raw_out);
    if (not summary and not res.exit_stat.exited_successfully()) {
        return result_fail(
            raw_out.empty() ? concat_tostr("OCaml runtime error: ", res.exit_stat.message)
                            : raw_out,
            ErrorKind::RUNTIME_ERROR
        );
    }

    bool success = summary ? (summary->failures == 0 and summary->errors == 0)
                           : res.exit_stat.exited_successfully();
    if (success) {
        return result_ok(newline_terminated(std::move(raw_out)));
    }
    return result_fail(newline_terminated(std::move(raw_out)), ErrorKind::TESTS_FAILED);
}

} // namespace grader::harness
