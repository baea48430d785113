#include <gradelib/grader/types.hh>
#include <gradelib/macros/throw.hh>
#include <nlohmann/json.hpp>
#include <utility>

using std::optional;
using std::string;
using std::string_view;

namespace grader {

string_view to_str(Language lang) noexcept {
    switch (lang) {
    case Language::JS: return "js";
    case Language::PYTHON: return "python";
    case Language::OCAML: return "ocaml";
    }
    __builtin_unreachable();
}

optional<Language> language_from_str(string_view str) noexcept {
    for (auto lang : {Language::JS, Language::PYTHON, Language::OCAML}) {
        if (to_str(lang) == str) {
            return lang;
        }
    }
    return std::nullopt;
}

string_view to_str(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::COMPILE_ERROR: return "compile_error";
    case ErrorKind::TIMEOUT: return "timeout";
    case ErrorKind::RUNTIME_ERROR: return "runtime_error";
    case ErrorKind::TESTS_FAILED: return "tests_failed";
    case ErrorKind::BAD_LANGUAGE_DETECTION: return "bad_language_detection";
    }
    __builtin_unreachable();
}

optional<ErrorKind> error_kind_from_str(string_view str) noexcept {
    for (auto kind :
         {ErrorKind::COMPILE_ERROR,
          ErrorKind::TIMEOUT,
          ErrorKind::RUNTIME_ERROR,
          ErrorKind::TESTS_FAILED,
          ErrorKind::BAD_LANGUAGE_DETECTION})
    {
        if (to_str(kind) == str) {
            return kind;
        }
    }
    return std::nullopt;
}

RunResult result_ok(string output) {
    return {
        .success = true,
        .output = std::move(output),
        .error = std::nullopt,
        .timeout = false,
    };
}

RunResult result_fail(string output, ErrorKind kind) {
    return {
        .success = false,
        .output = std::move(output),
        .error = kind,
        .timeout = (kind == ErrorKind::TIMEOUT),
    };
}

RunResult result_run_timeout(uint64_t timeout_ms) {
    return result_fail(
        concat_tostr("Run exceeded ", timeout_ms, " ms during test execution phase."),
        ErrorKind::TIMEOUT
    );
}

void to_json(nlohmann::json& j, const RunRequest& req) {
    j = nlohmann::json{
        {"solution", req.solution},
        {"tests", req.tests},
    };
    if (req.language) {
        j["language"] = string(to_str(*req.language));
    }
    if (req.timeout_ms) {
        j["timeoutMs"] = *req.timeout_ms;
    }
    if (req.memory_mb) {
        j["memoryMb"] = *req.memory_mb;
    }
}

void from_json(const nlohmann::json& j, RunRequest& req) {
    j.at("solution").get_to(req.solution);
    j.at("tests").get_to(req.tests);

    req.language = std::nullopt;
    if (auto it = j.find("language"); it != j.end() and not it->is_null()) {
        auto str = it->get<string>();
        req.language = language_from_str(str);
        if (not req.language) {
            THROW("Unknown language: ", str);
        }
    }

    auto get_opt_uint = [&](const char* name) -> optional<uint64_t> {
        if (auto it = j.find(name); it != j.end() and not it->is_null()) {
            if (not it->is_number_unsigned()) {
                THROW("Field ", name, " has to be a non-negative integer");
            }
            return it->get<uint64_t>();
        }
        return std::nullopt;
    };
    req.timeout_ms = get_opt_uint("timeoutMs");
    req.memory_mb = get_opt_uint("memoryMb");
}

void to_json(nlohmann::json& j, const RunResult& res) {
    j = nlohmann::json{
        {"success", res.success},
        {"output", res.output},
        {"error", nullptr},
        {"timeout", res.timeout},
    };
    if (res.error) {
        j["error"] = string(to_str(*res.error));
    }
}

void from_json(const nlohmann::json& j, RunResult& res) {
    j.at("output").get_to(res.output);
    res.error = std::nullopt;
    if (auto it = j.find("error"); it != j.end() and not it->is_null()) {
        auto str = it->get<string>();
        res.error = error_kind_from_str(str);
        if (not res.error) {
            THROW("Unknown error kind: ", str);
        }
    }

    if (j.value("timeout", false) and not res.error) {
        res.error = ErrorKind::TIMEOUT;
    }
    if (not j.at("success").get<bool>() and not res.error) {
        res.error = ErrorKind::RUNTIME_ERROR;
    }
    res.timeout = (res.error == ErrorKind::TIMEOUT);
    res.success = not res.error;
}

} // namespace grader
