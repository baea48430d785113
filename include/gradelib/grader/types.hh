#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace grader {

enum class Language {
    JS,
    PYTHON,
    OCAML,
};

// Returns "js", "python" or "ocaml"
[[nodiscard]] std::string_view to_str(Language lang) noexcept;

[[nodiscard]] std::optional<Language> language_from_str(std::string_view str) noexcept;

enum class ErrorKind {
    COMPILE_ERROR,
    TIMEOUT,
    RUNTIME_ERROR,
    TESTS_FAILED,
    BAD_LANGUAGE_DETECTION,
};

// Returns e.g. "compile_error" or "bad_language_detection"
[[nodiscard]] std::string_view to_str(ErrorKind kind) noexcept;

[[nodiscard]] std::optional<ErrorKind> error_kind_from_str(std::string_view str) noexcept;

constexpr uint64_t DEFAULT_TIMEOUT_MS = 60'000;

struct RunRequest {
    std::string solution;
    std::string tests;
    std::optional<Language> language = std::nullopt; // detected if not set
    std::optional<uint64_t> timeout_ms = std::nullopt;
    std::optional<uint64_t> memory_mb = std::nullopt; // reserved, not enforced
};

struct RunResult {
    bool success = false;
    std::string output;
    std::optional<ErrorKind> error = std::nullopt;
    bool timeout = false;

    friend bool operator==(const RunResult&, const RunResult&) = default;
};

[[nodiscard]] RunResult result_ok(std::string output);

// Sets timeout iff @p kind is ErrorKind::TIMEOUT
[[nodiscard]] RunResult result_fail(std::string output, ErrorKind kind);

// "Run exceeded <timeout_ms> ms during test execution phase."
[[nodiscard]] RunResult result_run_timeout(uint64_t timeout_ms);

// nlohmann::json conversions (found via ADL). from_json() throws
// std::runtime_error on invalid enumerator strings and nlohmann::json
// exceptions on wrong types.
void to_json(nlohmann::json& j, const RunRequest& req);
void from_json(const nlohmann::json& j, RunRequest& req);
void to_json(nlohmann::json& j, const RunResult& res);
// Re-establishes RunResult invariants
void from_json(const nlohmann::json& j, RunResult& res);

} // namespace grader
