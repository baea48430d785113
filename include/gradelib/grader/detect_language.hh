#pragma once

#include <gradelib/grader/types.hh>
#include <optional>
#include <string_view>
#include <variant>

namespace grader {

// Language signalled by a single source text: a closed code fence tag, then a
// "LANG:" header comment on the first non-blank line, then heuristics
[[nodiscard]] std::optional<Language> detect_language_of(std::string_view source);

// The language detected from @p tests wins over the one from @p solution
[[nodiscard]] std::optional<Language>
detect_language_raw(std::string_view solution, std::string_view tests);

// Returns the detected language or a bad_language_detection result
[[nodiscard]] std::variant<Language, RunResult>
detect_language_or_error(std::string_view solution, std::string_view tests);

// Explicit req.language bypasses detection
[[nodiscard]] std::variant<Language, RunResult> detect_language(const RunRequest& req);

} // namespace grader
