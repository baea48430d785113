#include <exception>
#include <gradelib/concat_tostr.hh>
#include <gradelib/grader/autograder.hh>
#include <gradelib/grader/detect_language.hh>
#include <gradelib/grader/dispatch.hh>
#include <gradelib/logger.hh>
#include <utility>
#include <variant>

namespace {

grader::RunResult
run_in_unit(grader::UnitVariant variant, const grader::RunRequest& req, const grader::Config& config) {
    using grader::ErrorKind;
    try {
        auto lang_or_error = grader::detect_language(req);
        if (auto* res = std::get_if<grader::RunResult>(&lang_or_error)) {
            return std::move(*res);
        }

        grader::RunRequest resolved = req;
        resolved.language = std::get<grader::Language>(lang_or_error);
        resolved.timeout_ms = req.timeout_ms.value_or(config.default_timeout_ms);
        return grader::dispatch_to_unit(variant, resolved, config);
    } catch (const std::exception& e) {
        errlog("Grading failed: ", e.what());
        return grader::result_fail(e.what(), ErrorKind::RUNTIME_ERROR);
    }
}

template <class Func>
grader::RunResult with_default_config(Func&& func) {
    grader::Config config;
    try {
        config = grader::default_config();
    } catch (const std::exception& e) {
        errlog("Cannot load config: ", e.what());
        return grader::result_fail(
            concat_tostr("Cannot load config: ", e.what()), grader::ErrorKind::RUNTIME_ERROR
        );
    }
    return func(config);
}

} // namespace

namespace grader {

RunResult run_autograder(const RunRequest& req, const Config& config) {
    return run_in_unit(UnitVariant::INTERACTIVE, req, config);
}

RunResult run_autograder(const RunRequest& req) {
    return with_default_config([&](const Config& config) { return run_autograder(req, config); });
}

RunResult run_in_server(const RunRequest& req, const Config& config) {
    return run_in_unit(UnitVariant::SERVER_HOSTED, req, config);
}

RunResult run_in_server(const RunRequest& req) {
    return with_default_config([&](const Config& config) { return run_in_server(req, config); });
}

std::future<RunResult> run_autograder_async(RunRequest req, Config config) {
    return std::async(std::launch::async, [req = std::move(req), config = std::move(config)] {
        return run_autograder(req, config);
    });
}

std::future<RunResult> run_autograder_async(RunRequest req) {
    return std::async(std::launch::async, [req = std::move(req)] { return run_autograder(req); });
}

std::future<RunResult> run_in_server_async(RunRequest req, Config config) {
    return std::async(std::launch::async, [req = std::move(req), config = std::move(config)] {
        return run_in_server(req, config);
    });
}

std::future<RunResult> run_in_server_async(RunRequest req) {
    return std::async(std::launch::async, [req = std::move(req)] { return run_in_server(req); });
}

} // namespace grader
